/**
 * @file transferexecutor.h
 * @brief Runs queued transfers against the storage gateway.
 *
 * The executor turns batches of transfer requests into gateway calls and
 * feeds status and progress back into the TransferQueue, which stays the
 * single source of truth for record state.
 */

#ifndef TRANSFEREXECUTOR_H
#define TRANSFEREXECUTOR_H

#include <QElapsedTimer>
#include <QList>
#include <QMap>
#include <QObject>
#include <QPointer>
#include <QQueue>
#include <QString>
#include <QStringList>
#include <functional>

#include "models/transferqueue.h"
#include "gatewayerror.h"

class GatewayReply;
class IStorageGateway;
class InvalidationBridge;

/**
 * @brief One file the user asked to move.
 */
struct TransferRequest {
    TransferType type = TransferType::Upload;
    QString localPath;       ///< Upload source or download destination
    QString bucket;
    QString key;
    qint64 totalBytes = -1;  ///< -1 if unknown; uploads then stat the local file
    QString fileName;        ///< Display name, derived from path or key if empty
};

/**
 * @brief Outcome counts of a finished batch.
 */
struct BatchResult {
    int batchId = -1;
    QString connectionId;
    int succeeded = 0;
    int failed = 0;
    int cancelled = 0;

    [[nodiscard]] int total() const { return succeeded + failed + cancelled; }
    [[nodiscard]] bool allSucceeded() const { return failed == 0 && cancelled == 0; }
};

/**
 * @brief Executes transfer batches sequentially per batch, batches concurrently.
 *
 * Each call to submitBatch() represents one user action ("upload these N
 * files"). Items of a batch run one after another; independent batches run
 * side by side, optionally capped by setMaxConcurrentBatches().
 *
 * A failed item never stops its siblings. There is no automatic retry; the
 * user starts a new transfer instead.
 *
 * @par Example usage:
 * @code
 * TransferExecutor *executor = new TransferExecutor(gateway, queue, bridge, this);
 * connect(executor, &TransferExecutor::batchFinished,
 *         this, [](const BatchResult &result) {
 *     qDebug() << result.succeeded << "ok," << result.failed << "failed";
 * });
 *
 * TransferRequest request;
 * request.type = TransferType::Upload;
 * request.localPath = "/home/me/photo.png";
 * request.bucket = "photos";
 * request.key = "2024/photo.png";
 * executor->submitBatch("conn-1", {request});
 * @endcode
 */
class TransferExecutor : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs an executor.
     * @param gateway Storage gateway used for transfers (not owned).
     * @param queue Queue receiving record updates (not owned).
     * @param bridge Bridge notified after successful uploads (not owned, may be null).
     * @param parent Optional parent QObject for memory management.
     */
    explicit TransferExecutor(IStorageGateway *gateway,
                              TransferQueue *queue,
                              InvalidationBridge *bridge = nullptr,
                              QObject *parent = nullptr);
    ~TransferExecutor() override;

    /**
     * @brief Enqueues one record per request and schedules the batch.
     * @return The batch id, or -1 if @p requests is empty.
     */
    int submitBatch(const QString &connectionId, const QList<TransferRequest> &requests);

    /// @name Cancellation
    /// @{

    /**
     * @brief Cancels one transfer.
     * @return False if the id is unknown or the transfer already finished.
     *
     * A queued transfer is marked cancelled and skipped. A running one has its
     * gateway reply aborted and ends cancelled.
     */
    bool cancelTransfer(const QString &transferId);

    /**
     * @brief Cancels every unfinished transfer of a batch.
     */
    bool cancelBatch(int batchId);

    void cancelAll();
    /// @}

    /// @name Settings
    /// @{

    /**
     * @brief Caps the number of batches running at once.
     * @param count Maximum running batches, 0 for unlimited.
     */
    void setMaxConcurrentBatches(int count);
    [[nodiscard]] int maxConcurrentBatches() const { return maxConcurrentBatches_; }

    /**
     * @brief Configures progress forwarding.
     * @param stepPercent Minimum percentage advance between forwarded updates.
     * @param intervalMs Minimum time between forwarded updates if the step is not reached.
     */
    void setProgressThrottle(int stepPercent, int intervalMs);
    [[nodiscard]] int progressStepPercent() const { return progressStepPercent_; }
    [[nodiscard]] int progressIntervalMs() const { return progressIntervalMs_; }
    /// @}

    /// @name State
    /// @{
    [[nodiscard]] int runningBatchCount() const;
    [[nodiscard]] int pendingBatchCount() const { return static_cast<int>(waiting_.size()); }
    [[nodiscard]] bool isIdle() const { return batches_.isEmpty(); }
    [[nodiscard]] QStringList transferIds(int batchId) const;
    /// @}

    /**
     * @brief Runs deferred work immediately.
     *
     * Follow-up steps are normally processed on the next event-loop turn.
     * Tests call this to advance the executor deterministically.
     */
    void flushEventQueue();

signals:
    void batchStarted(int batchId);
    void batchFinished(const BatchResult &result);
    void allBatchesFinished();

    void transferStarted(const QString &transferId);
    void transferSucceeded(const QString &transferId);
    /**
     * @brief Emitted when a transfer ends with a gateway error.
     * @param errorMessage The gateway message, verbatim.
     * @param kind The error class the gateway reported.
     */
    void transferFailed(const QString &transferId, const QString &errorMessage,
                        GatewayErrorKind kind);
    void transferCancelled(const QString &transferId);

private:
    struct BatchItem {
        QString transferId;
        TransferRequest request;
        bool cancelled = false;
    };

    struct Batch {
        int id = -1;
        QString connectionId;
        QList<BatchItem> items;
        int nextIndex = 0;     // Index of the next item to start
        bool running = false;
        QPointer<GatewayReply> reply;
        int lastForwardedPercent = 0;
        QElapsedTimer sinceLastForward;
        BatchResult result;
    };

    void scheduleEvent(std::function<void()> event);
    void processEventQueue();

    void dispatchWaiting();
    void startNextItem(int batchId);
    void onItemProgress(int batchId, qint64 bytesDone, qint64 bytesTotal);
    void onItemFinished(int batchId);
    void finishBatch(int batchId);
    void markCancelled(const QString &transferId);

    IStorageGateway *gateway_ = nullptr;
    TransferQueue *queue_ = nullptr;
    QPointer<InvalidationBridge> bridge_;

    QMap<int, Batch> batches_;
    QQueue<int> waiting_;
    int nextBatchId_ = 1;

    int maxConcurrentBatches_ = 0;
    int progressStepPercent_ = 1;
    int progressIntervalMs_ = 100;

    // Deferred work, drained on the next event-loop turn
    QQueue<std::function<void()>> eventQueue_;
    bool eventProcessingScheduled_ = false;
    bool processingEvents_ = false;
};

#endif // TRANSFEREXECUTOR_H
