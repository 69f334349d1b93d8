/**
 * @file istoragegateway.h
 * @brief Interface for object storage gateway implementations.
 *
 * This interface allows dependency injection of storage backends, enabling
 * runtime swapping between production and mock implementations for testing.
 */

#ifndef ISTORAGEGATEWAY_H
#define ISTORAGEGATEWAY_H

#include <QObject>
#include <QString>
#include <QStringList>

#include "gatewayreply.h"

/**
 * @brief Abstract interface for S3-compatible object store access.
 *
 * Every operation returns a GatewayReply immediately; the result arrives
 * through the reply's finished() signal on a later event-loop turn. An
 * implementation must never finish a reply inside the call that created it,
 * otherwise callers would miss the signal.
 *
 * Ownership of the returned reply passes to the caller.
 *
 * @par Example usage:
 * @code
 * // Production code
 * IStorageGateway *gateway = new LocalStorageGateway("/srv/buckets", this);
 *
 * // Test code
 * IStorageGateway *gateway = new MockStorageGateway(this);
 *
 * // Both can be used identically
 * GatewayReply *reply = gateway->listObjects("local", "photos", "2024/", QString(), 500);
 * @endcode
 */
class IStorageGateway : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a storage gateway interface.
     * @param parent Optional parent QObject for memory management.
     */
    explicit IStorageGateway(QObject *parent = nullptr) : QObject(parent) {}

    /**
     * @brief Virtual destructor.
     */
    ~IStorageGateway() override = default;

    /// @name Listing
    /// @{

    /**
     * @brief Lists one page of objects and common prefixes under a prefix.
     * @param connectionId Connection the bucket belongs to.
     * @param bucket Bucket name.
     * @param prefix Key prefix ("folder"), empty for the bucket root.
     * @param continuationToken Token from the previous page, empty for the first page.
     * @param maxKeys Maximum number of entries (objects and prefixes) in the page.
     */
    virtual GatewayReply *listObjects(const QString &connectionId, const QString &bucket,
                                      const QString &prefix, const QString &continuationToken,
                                      int maxKeys) = 0;
    /// @}

    /// @name Object Transfer
    /// @{

    /**
     * @brief Uploads a local file.
     * @param sourceLocalPath Path of the local file to read.
     *
     * The reply reports progress at chunk boundaries.
     */
    virtual GatewayReply *putObject(const QString &connectionId, const QString &bucket,
                                    const QString &key, const QString &sourceLocalPath) = 0;

    /**
     * @brief Downloads an object to a local file.
     * @param destinationLocalPath Path of the local file to write.
     *
     * The reply reports progress at chunk boundaries.
     */
    virtual GatewayReply *getObject(const QString &connectionId, const QString &bucket,
                                    const QString &key, const QString &destinationLocalPath) = 0;
    /// @}

    /// @name Object Management
    /// @{

    /**
     * @brief Deletes objects. Missing keys are not an error.
     */
    virtual GatewayReply *deleteObjects(const QString &connectionId, const QString &bucket,
                                        const QStringList &keys) = 0;

    /**
     * @brief Copies an object within a bucket.
     */
    virtual GatewayReply *copyObject(const QString &connectionId, const QString &bucket,
                                     const QString &sourceKey, const QString &destinationKey) = 0;

    /**
     * @brief Creates a zero-byte folder marker.
     * @param folderKey Folder path; a trailing '/' is added if missing.
     */
    virtual GatewayReply *createFolder(const QString &connectionId, const QString &bucket,
                                       const QString &folderKey) = 0;
    /// @}

    /// @name Sharing and Metadata
    /// @{

    /**
     * @brief Generates a time-limited URL for a single object.
     * @param ttlSeconds Validity period in seconds.
     *
     * The URL is available from GatewayReply::url().
     */
    virtual GatewayReply *presignUrl(const QString &connectionId, const QString &bucket,
                                     const QString &key, int ttlSeconds) = 0;

    /**
     * @brief Fetches object metadata.
     *
     * The result is available from GatewayReply::metadata().
     */
    virtual GatewayReply *headMetadata(const QString &connectionId, const QString &bucket,
                                       const QString &key) = 0;
    /// @}
};

#endif // ISTORAGEGATEWAY_H
