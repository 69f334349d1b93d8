/**
 * @file localstoragegateway.h
 * @brief Storage gateway backed by a local directory tree.
 *
 * Each top-level directory under the root is a bucket and every file below
 * it is an object whose key is its relative path. Used by the command-line
 * front end and by tests that need real file I/O.
 */

#ifndef LOCALSTORAGEGATEWAY_H
#define LOCALSTORAGEGATEWAY_H

#include <QByteArray>
#include <QDateTime>
#include <QString>
#include <functional>
#include <memory>

#include "istoragegateway.h"

/**
 * @brief IStorageGateway over `<root>/<bucket>/<key>`.
 *
 * Listing uses '/' as the delimiter: files directly under the prefix are
 * objects, directories are common prefixes. Transfers copy one chunk per
 * event-loop turn so progress is observable and abort() takes effect
 * between chunks.
 *
 * The connection id is accepted for interface compatibility and otherwise
 * ignored; one gateway instance serves one root.
 */
class LocalStorageGateway : public IStorageGateway
{
    Q_OBJECT

public:
    static constexpr int DefaultMaxKeys = 500;
    static constexpr int MaxKeys = 1000;
    static constexpr qint64 DefaultChunkSize = 256 * 1024;
    static constexpr int MaxPresignTtlSeconds = 7 * 24 * 60 * 60;

    /**
     * @brief Constructs a gateway serving @p rootPath.
     * @param rootPath Directory whose subdirectories are buckets.
     * @param parent Optional parent QObject for memory management.
     */
    explicit LocalStorageGateway(const QString &rootPath, QObject *parent = nullptr);
    ~LocalStorageGateway() override;

    [[nodiscard]] QString rootPath() const { return rootPath_; }

    void setChunkSize(qint64 bytes);
    [[nodiscard]] qint64 chunkSize() const { return chunkSize_; }

    /**
     * @brief Sets the secret used to sign presigned URLs.
     *
     * A random secret is generated at construction.
     */
    void setSigningSecret(const QByteArray &secret) { signingSecret_ = secret; }

    /**
     * @brief Checks the signature and expiry of a URL from presignUrl().
     * @param url The presigned URL.
     * @param now Time to check the expiry against.
     */
    [[nodiscard]] bool verifyPresignedUrl(const QString &url,
                                          const QDateTime &now = QDateTime::currentDateTimeUtc()) const;

    // IStorageGateway interface
    GatewayReply *listObjects(const QString &connectionId, const QString &bucket,
                              const QString &prefix, const QString &continuationToken,
                              int maxKeys) override;
    GatewayReply *putObject(const QString &connectionId, const QString &bucket,
                            const QString &key, const QString &sourceLocalPath) override;
    GatewayReply *getObject(const QString &connectionId, const QString &bucket,
                            const QString &key, const QString &destinationLocalPath) override;
    GatewayReply *deleteObjects(const QString &connectionId, const QString &bucket,
                                const QStringList &keys) override;
    GatewayReply *copyObject(const QString &connectionId, const QString &bucket,
                             const QString &sourceKey, const QString &destinationKey) override;
    GatewayReply *createFolder(const QString &connectionId, const QString &bucket,
                               const QString &folderKey) override;
    GatewayReply *presignUrl(const QString &connectionId, const QString &bucket,
                             const QString &key, int ttlSeconds) override;
    GatewayReply *headMetadata(const QString &connectionId, const QString &bucket,
                               const QString &key) override;

private:
    struct CopyJob;

    [[nodiscard]] QString bucketPath(const QString &bucket) const;
    [[nodiscard]] QString objectPath(const QString &bucket, const QString &key) const;
    [[nodiscard]] bool bucketExists(const QString &bucket) const;
    [[nodiscard]] static bool isSafeName(const QString &bucket);
    [[nodiscard]] static bool isSafeKey(const QString &key);
    [[nodiscard]] QByteArray signature(const QString &path, qint64 expires) const;

    /**
     * @brief Runs @p work on the next event-loop turn unless the reply has finished.
     */
    void completeLater(GatewayReply *reply, std::function<void()> work);

    /**
     * @brief Validates a bucket (and optionally a key), failing the reply if needed.
     * @return True if the request may proceed.
     */
    bool checkTarget(GatewayReply *reply, const QString &bucket, const QString &key,
                     bool keyRequired);

    void startCopy(GatewayReply *reply, const QString &sourcePath, const QString &destinationPath,
                   const QString &missingSourceMessage);
    void copyNextChunk(const std::shared_ptr<CopyJob> &job);
    static void discardPartial(const std::shared_ptr<CopyJob> &job);

    QString rootPath_;
    qint64 chunkSize_ = DefaultChunkSize;
    QByteArray signingSecret_;
};

#endif // LOCALSTORAGEGATEWAY_H
