/**
 * @file gatewayreply.h
 * @brief Handle for one outstanding Storage Gateway call.
 *
 * Modelled on QNetworkReply: the gateway hands out a reply immediately and
 * completes it later from the event loop. The caller owns the reply once it
 * has been returned and should release it with deleteLater() after finished().
 */

#ifndef GATEWAYREPLY_H
#define GATEWAYREPLY_H

#include <QObject>
#include <QString>

#include "gatewayerror.h"
#include "storageentry.h"

/**
 * @brief Asynchronous result of a Storage Gateway operation.
 *
 * A reply finishes exactly once. The first of finishWith*(), fail() or
 * abort() wins; everything after that is ignored, which lets a gateway keep
 * running a copy loop after abort() without double-reporting.
 *
 * @par Example usage:
 * @code
 * GatewayReply *reply = gateway->putObject(conn, "photos", "a.png", "/tmp/a.png");
 * connect(reply, &GatewayReply::progress, this, &MyClass::onProgress);
 * connect(reply, &GatewayReply::finished, this, [reply]() {
 *     if (reply->hasError()) {
 *         qWarning() << reply->errorString();
 *     }
 *     reply->deleteLater();
 * });
 * @endcode
 */
class GatewayReply : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief The gateway operation a reply belongs to.
     */
    enum class Operation {
        List,
        Put,
        Get,
        Delete,
        Copy,
        CreateFolder,
        Presign,
        Head
    };
    Q_ENUM(Operation)

    /**
     * @brief Constructs a reply.
     * @param operation The operation this reply reports on.
     * @param parent Optional parent QObject for memory management.
     */
    explicit GatewayReply(Operation operation, QObject *parent = nullptr);
    ~GatewayReply() override;

    [[nodiscard]] Operation operation() const { return operation_; }
    [[nodiscard]] bool isFinished() const { return finished_; }
    [[nodiscard]] bool hasError() const { return error_.isError(); }
    [[nodiscard]] GatewayError error() const { return error_; }
    [[nodiscard]] QString errorString() const { return error_.message; }

    /// @name Results
    /// Only meaningful after finished() without error.
    /// @{
    [[nodiscard]] ListingPage listingPage() const { return listingPage_; }
    [[nodiscard]] QString url() const { return url_; }
    [[nodiscard]] ObjectMetadata metadata() const { return metadata_; }
    [[nodiscard]] qint64 bytesDone() const { return bytesDone_; }
    [[nodiscard]] qint64 bytesTotal() const { return bytesTotal_; }
    /// @}

    /**
     * @brief Requests cancellation.
     *
     * Emits abortRequested() so the gateway can stop its work, then finishes
     * the reply with a Cancelled error. No-op once finished.
     */
    void abort();

    /// @name Completion API (for gateway implementations)
    /// @{
    void reportProgress(qint64 bytesDone, qint64 bytesTotal);
    void finishWithListing(const ListingPage &page);
    void finishWithUrl(const QString &url);
    void finishWithMetadata(const ObjectMetadata &metadata);
    void finishSuccess();
    void fail(const GatewayError &error);
    /// @}

signals:
    /**
     * @brief Emitted at chunk boundaries of a put or get.
     * @param bytesDone Bytes transferred so far.
     * @param bytesTotal Total bytes (0 if unknown).
     */
    void progress(qint64 bytesDone, qint64 bytesTotal);

    /**
     * @brief Emitted once when abort() is called on an unfinished reply.
     */
    void abortRequested();

    /**
     * @brief Emitted exactly once when the operation ends, successfully or not.
     */
    void finished();

private:
    bool markFinished();

    Operation operation_;
    bool finished_ = false;
    GatewayError error_;
    ListingPage listingPage_;
    QString url_;
    ObjectMetadata metadata_;
    qint64 bytesDone_ = 0;
    qint64 bytesTotal_ = 0;
};

#endif // GATEWAYREPLY_H
