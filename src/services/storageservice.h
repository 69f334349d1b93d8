/**
 * @file storageservice.h
 * @brief Service for coordinating bucket operations.
 *
 * This service is the command layer a front end talks to. Transfers go
 * through the TransferExecutor; one-shot operations (delete, rename,
 * create folder, presign, metadata) go straight to the gateway.
 */

#ifndef STORAGESERVICE_H
#define STORAGESERVICE_H

#include <QHash>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <functional>

#include "models/transferqueue.h"
#include "gatewayerror.h"
#include "storageentry.h"
#include "transferexecutor.h"

class ConnectionHealthStore;
class GatewayReply;
class IStorageGateway;
class InvalidationBridge;

/**
 * @brief Service for coordinating bucket operations.
 *
 * StorageService provides a high-level interface for object operations,
 * decoupling front ends from the executor and gateway. Benefits include:
 * - Front ends can be tested against a mock gateway
 * - Invalidation after mutations is centralized
 * - Connection health is updated from every outcome in one place
 *
 * @par Example usage:
 * @code
 * StorageService *service = new StorageService(gateway, executor, bridge, health, this);
 *
 * connect(service, &StorageService::statusMessage,
 *         this, &MyWidget::showStatus);
 *
 * service->uploadFiles("conn-1", "photos", "2024/", {"/home/me/a.png", "/home/me/b.png"});
 * service->renameObject("conn-1", "photos", "2024/a.png", "2024/beach.png");
 * @endcode
 */
class StorageService : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultPresignTtlSeconds = 3600;

    /**
     * @brief Constructs a storage service.
     * @param gateway Gateway for one-shot operations (not owned).
     * @param executor Executor running uploads and downloads (not owned).
     * @param bridge Bridge notified after mutations (not owned, may be null).
     * @param health Store receiving connection health (not owned, may be null).
     * @param parent Optional parent QObject for memory management.
     */
    explicit StorageService(IStorageGateway *gateway,
                            TransferExecutor *executor,
                            InvalidationBridge *bridge = nullptr,
                            ConnectionHealthStore *health = nullptr,
                            QObject *parent = nullptr);

    /**
     * @brief Destructor. Aborts operations still outstanding.
     */
    ~StorageService() override;

    /// @name Transfers
    /// @{

    /**
     * @brief Uploads local files into a folder of a bucket.
     * @param prefix Destination folder; each key is the prefix plus the file name.
     * @param localPaths Files to upload.
     * @return Batch id, or -1 if @p localPaths is empty.
     */
    int uploadFiles(const QString &connectionId, const QString &bucket,
                    const QString &prefix, const QStringList &localPaths);

    /**
     * @brief Downloads objects into a local directory.
     * @param keys Objects to download; each lands under its last key segment.
     * @param localDir Destination directory.
     * @return Batch id, or -1 if @p keys is empty.
     */
    int downloadObjects(const QString &connectionId, const QString &bucket,
                        const QStringList &keys, const QString &localDir);
    /// @}

    /// @name Object Management
    /// @{

    /**
     * @brief Deletes objects.
     * @return False if @p keys is empty, true if the request was sent.
     */
    bool deleteObjects(const QString &connectionId, const QString &bucket, const QStringList &keys);

    /**
     * @brief Renames an object by copying it and deleting the source.
     * @return False if the keys are empty or identical.
     */
    bool renameObject(const QString &connectionId, const QString &bucket,
                      const QString &oldKey, const QString &newKey);

    /**
     * @brief Creates a folder marker.
     * @param prefix Parent folder, empty for the bucket root.
     * @param folderName Name of the new folder.
     */
    bool createFolder(const QString &connectionId, const QString &bucket,
                      const QString &prefix, const QString &folderName);
    /// @}

    /// @name Sharing and Metadata
    /// @{

    /**
     * @brief Requests a presigned URL using the default TTL.
     */
    bool presignUrl(const QString &connectionId, const QString &bucket, const QString &key);
    bool presignUrl(const QString &connectionId, const QString &bucket, const QString &key,
                    int ttlSeconds);

    bool fetchMetadata(const QString &connectionId, const QString &bucket, const QString &key);

    void setDefaultPresignTtl(int seconds) { defaultPresignTtl_ = seconds; }
    [[nodiscard]] int defaultPresignTtl() const { return defaultPresignTtl_; }
    /// @}

    /**
     * @brief Number of one-shot operations still waiting for the gateway.
     */
    [[nodiscard]] int pendingOperationCount() const;

    /**
     * @brief Joins a folder prefix and a name into a key.
     */
    [[nodiscard]] static QString joinKey(const QString &prefix, const QString &name);

signals:
    void objectsDeleted(const QString &connectionId, const QString &bucket, const QStringList &keys);
    void objectRenamed(const QString &connectionId, const QString &bucket,
                       const QString &oldKey, const QString &newKey);
    void folderCreated(const QString &connectionId, const QString &bucket, const QString &folderKey);
    void presignedUrlReady(const QString &connectionId, const QString &bucket,
                           const QString &key, const QString &url);
    void metadataReady(const QString &connectionId, const QString &bucket,
                       const ObjectMetadata &metadata);

    /**
     * @brief Emitted when an operation fails.
     * @param key The object (or first object) the operation was about.
     * @param error The gateway message, verbatim.
     */
    void operationFailed(const QString &connectionId, const QString &bucket,
                         const QString &key, const QString &error);

    /**
     * @brief Emitted when a transfer batch finishes.
     */
    void transfersFinished(int batchId, TransferType type, int succeeded, int failed);

    /**
     * @brief Emitted when a status message should be displayed.
     * @param message The message text.
     * @param timeout Display duration in milliseconds.
     */
    void statusMessage(const QString &message, int timeout);

    /**
     * @brief Emitted when no operation or transfer is outstanding.
     */
    void idle();

private slots:
    void onBatchFinished(const BatchResult &result);
    void onTransferSucceeded(const QString &transferId);
    void onTransferFailed(const QString &transferId, const QString &errorMessage,
                          GatewayErrorKind kind);
    void onTransferCancelled(const QString &transferId);

private:
    using SuccessHandler = std::function<void(GatewayReply *)>;

    void watch(GatewayReply *reply, const QString &connectionId, const QString &bucket,
               const QString &key, const SuccessHandler &onSuccess);
    void recordOutcome(const QString &connectionId, const GatewayError &error);
    void rememberBatch(int batchId, TransferType type, const QString &connectionId);
    void checkIdle();

    IStorageGateway *gateway_ = nullptr;
    TransferExecutor *executor_ = nullptr;
    QPointer<InvalidationBridge> bridge_;
    QPointer<ConnectionHealthStore> health_;

    QList<QPointer<GatewayReply>> pending_;
    QHash<int, TransferType> batchTypes_;
    QHash<QString, QString> transferConnections_;  // transfer id -> connection id

    int defaultPresignTtl_ = DefaultPresignTtlSeconds;
};

#endif // STORAGESERVICE_H
