#include "transferexecutor.h"
#include "gatewayreply.h"
#include "invalidationbridge.h"
#include "istoragegateway.h"
#include "utils/logging.h"

#include <QDateTime>
#include <QFileInfo>
#include <QTimer>
#include <utility>

TransferExecutor::TransferExecutor(IStorageGateway *gateway,
                                   TransferQueue *queue,
                                   InvalidationBridge *bridge,
                                   QObject *parent)
    : QObject(parent)
    , gateway_(gateway)
    , queue_(queue)
    , bridge_(bridge)
{
}

TransferExecutor::~TransferExecutor()
{
    // Outstanding replies must not report into a half-destroyed executor
    for (auto it = batches_.begin(); it != batches_.end(); ++it) {
        if (it->reply) {
            disconnect(it->reply, nullptr, this, nullptr);
            it->reply->abort();
            it->reply->deleteLater();
        }
    }
}

int TransferExecutor::submitBatch(const QString &connectionId, const QList<TransferRequest> &requests)
{
    if (requests.isEmpty()) {
        return -1;
    }

    Batch batch;
    batch.id = nextBatchId_++;
    batch.connectionId = connectionId;
    batch.result.batchId = batch.id;
    batch.result.connectionId = connectionId;

    for (TransferRequest request : requests) {
        if (request.totalBytes < 0 && request.type == TransferType::Upload) {
            QFileInfo info(request.localPath);
            request.totalBytes = info.exists() ? info.size() : 0;
        }
        if (request.fileName.isEmpty()) {
            request.fileName = request.type == TransferType::Upload
                ? QFileInfo(request.localPath).fileName()
                : request.key.section('/', -1);
        }

        TransferDescriptor descriptor;
        descriptor.type = request.type;
        descriptor.fileName = request.fileName;
        descriptor.bucket = request.bucket;
        descriptor.key = request.key;
        descriptor.totalBytes = qMax<qint64>(0, request.totalBytes);

        BatchItem item;
        item.transferId = queue_->enqueue(descriptor);
        item.request = request;
        batch.items.append(item);
    }

    const int batchId = batch.id;
    LOG_VERBOSE() << "TransferExecutor: Batch" << batchId << "submitted with"
                  << batch.items.size() << "items for" << connectionId;

    batches_.insert(batchId, batch);
    waiting_.enqueue(batchId);
    scheduleEvent([this]() { dispatchWaiting(); });

    return batchId;
}

void TransferExecutor::scheduleEvent(std::function<void()> event)
{
    eventQueue_.enqueue(std::move(event));

    if (!eventProcessingScheduled_) {
        eventProcessingScheduled_ = true;
        QTimer::singleShot(0, this, &TransferExecutor::processEventQueue);
    }
}

void TransferExecutor::processEventQueue()
{
    eventProcessingScheduled_ = false;

    // Re-entrancy guard: if we're already processing, let the outer call finish
    if (processingEvents_) {
        if (!eventQueue_.isEmpty() && !eventProcessingScheduled_) {
            eventProcessingScheduled_ = true;
            QTimer::singleShot(0, this, &TransferExecutor::processEventQueue);
        }
        return;
    }

    processingEvents_ = true;
    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }
    processingEvents_ = false;
}

void TransferExecutor::flushEventQueue()
{
    if (processingEvents_) {
        return;
    }

    eventProcessingScheduled_ = false;
    processingEvents_ = true;
    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }
    processingEvents_ = false;
}

void TransferExecutor::dispatchWaiting()
{
    while (!waiting_.isEmpty()) {
        if (maxConcurrentBatches_ > 0 && runningBatchCount() >= maxConcurrentBatches_) {
            LOG_VERBOSE() << "TransferExecutor:" << waiting_.size()
                          << "batches waiting for a free slot";
            return;
        }

        const int batchId = waiting_.dequeue();
        auto it = batches_.find(batchId);
        if (it == batches_.end()) {
            continue;
        }

        it->running = true;
        emit batchStarted(batchId);
        scheduleEvent([this, batchId]() { startNextItem(batchId); });
    }
}

void TransferExecutor::startNextItem(int batchId)
{
    auto it = batches_.find(batchId);
    if (it == batches_.end() || it->reply) {
        return;
    }

    while (it->nextIndex < it->items.size()) {
        const BatchItem item = it->items.at(it->nextIndex);
        it->nextIndex++;

        if (item.cancelled) {
            it->result.cancelled++;
            continue;
        }

        const TransferRequest &request = item.request;

        TransferUpdate started;
        started.status = TransferStatus::InProgress;
        started.startedAt = QDateTime::currentDateTime();
        queue_->update(item.transferId, started);

        LOG_VERBOSE() << "TransferExecutor: Starting"
                      << (request.type == TransferType::Upload ? "upload" : "download")
                      << request.bucket << request.key;

        GatewayReply *reply = nullptr;
        if (request.type == TransferType::Upload) {
            reply = gateway_->putObject(it->connectionId, request.bucket, request.key,
                                        request.localPath);
        } else {
            reply = gateway_->getObject(it->connectionId, request.bucket, request.key,
                                        request.localPath);
        }

        it->reply = reply;
        it->lastForwardedPercent = 0;
        it->sinceLastForward.start();

        connect(reply, &GatewayReply::progress, this,
                [this, batchId](qint64 bytesDone, qint64 bytesTotal) {
            onItemProgress(batchId, bytesDone, bytesTotal);
        });
        connect(reply, &GatewayReply::finished, this, [this, batchId]() {
            onItemFinished(batchId);
        });

        emit transferStarted(item.transferId);
        return;
    }

    finishBatch(batchId);
}

void TransferExecutor::onItemProgress(int batchId, qint64 bytesDone, qint64 bytesTotal)
{
    auto it = batches_.find(batchId);
    if (it == batches_.end() || it->nextIndex == 0) {
        return;
    }

    const BatchItem &item = it->items.at(it->nextIndex - 1);
    const qint64 total = bytesTotal > 0 ? bytesTotal : item.request.totalBytes;
    const int percent = total > 0 ? static_cast<int>(qBound<qint64>(0, bytesDone * 100 / total, 100)) : 0;

    const bool stepReached = percent - it->lastForwardedPercent >= progressStepPercent_;
    const bool intervalElapsed = it->sinceLastForward.elapsed() >= progressIntervalMs_;
    if (percent < 100 && !stepReached && !intervalElapsed) {
        return;
    }

    it->lastForwardedPercent = percent;
    it->sinceLastForward.restart();

    TransferUpdate changes;
    if (bytesTotal > 0) {
        changes.totalBytes = bytesTotal;
    }
    changes.bytesTransferred = bytesDone;
    changes.progress = percent;
    queue_->update(item.transferId, changes);
}

void TransferExecutor::onItemFinished(int batchId)
{
    auto it = batches_.find(batchId);
    if (it == batches_.end() || !it->reply || it->nextIndex == 0) {
        return;
    }

    GatewayReply *reply = it->reply;
    it->reply = nullptr;
    reply->deleteLater();

    const BatchItem item = it->items.at(it->nextIndex - 1);
    const TransferRequest &request = item.request;
    const QString connectionId = it->connectionId;

    if (reply->error().kind == GatewayErrorKind::Cancelled) {
        it->result.cancelled++;
        markCancelled(item.transferId);
    } else if (reply->hasError()) {
        it->result.failed++;

        const QString message = reply->errorString();
        qWarning() << "TransferExecutor: Transfer failed" << request.bucket << request.key
                   << ":" << message;

        TransferUpdate failed;
        failed.status = TransferStatus::Failed;
        failed.errorMessage = message;
        failed.completedAt = QDateTime::currentDateTime();
        queue_->update(item.transferId, failed);

        emit transferFailed(item.transferId, message, reply->error().kind);
    } else {
        it->result.succeeded++;

        // The gateway's count wins over the size seen at submission
        qint64 total = reply->bytesTotal() > 0 ? reply->bytesTotal() : request.totalBytes;
        total = qMax<qint64>(0, total);

        TransferUpdate completed;
        completed.status = TransferStatus::Completed;
        completed.progress = 100;
        completed.totalBytes = total;
        completed.bytesTransferred = total;
        completed.completedAt = QDateTime::currentDateTime();
        // A false return means the record was cleared meanwhile; the transfer still happened
        if (!queue_->update(item.transferId, completed)) {
            LOG_VERBOSE() << "TransferExecutor: Record" << item.transferId << "no longer queued";
        }

        // Downloads leave the bucket unchanged
        if (request.type == TransferType::Upload && bridge_) {
            bridge_->notifyMutation(connectionId, request.bucket, MutationKind::Upload);
        }

        emit transferSucceeded(item.transferId);
    }

    scheduleEvent([this, batchId]() { startNextItem(batchId); });
}

void TransferExecutor::finishBatch(int batchId)
{
    auto it = batches_.find(batchId);
    if (it == batches_.end()) {
        return;
    }

    const BatchResult result = it->result;
    batches_.erase(it);

    LOG_VERBOSE() << "TransferExecutor: Batch" << batchId << "finished:" << result.succeeded
                  << "succeeded," << result.failed << "failed," << result.cancelled << "cancelled";

    emit batchFinished(result);

    if (batches_.isEmpty()) {
        emit allBatchesFinished();
    } else {
        scheduleEvent([this]() { dispatchWaiting(); });
    }
}

void TransferExecutor::markCancelled(const QString &transferId)
{
    TransferUpdate cancelled;
    cancelled.status = TransferStatus::Cancelled;
    cancelled.completedAt = QDateTime::currentDateTime();
    queue_->update(transferId, cancelled);

    emit transferCancelled(transferId);
}

bool TransferExecutor::cancelTransfer(const QString &transferId)
{
    for (auto it = batches_.begin(); it != batches_.end(); ++it) {
        for (int i = 0; i < it->items.size(); ++i) {
            BatchItem &item = it->items[i];
            if (item.transferId != transferId) {
                continue;
            }

            const bool isCurrent = it->reply && i == it->nextIndex - 1;
            if (isCurrent) {
                LOG_VERBOSE() << "TransferExecutor: Aborting running transfer" << transferId;
                // abort() finishes the reply, onItemFinished() records the cancellation
                it->reply->abort();
                return true;
            }

            if (i < it->nextIndex || item.cancelled) {
                return false;
            }

            item.cancelled = true;
            markCancelled(transferId);
            return true;
        }
    }
    return false;
}

bool TransferExecutor::cancelBatch(int batchId)
{
    auto it = batches_.find(batchId);
    if (it == batches_.end()) {
        return false;
    }

    QStringList pendingIds;
    for (int i = it->nextIndex; i < it->items.size(); ++i) {
        BatchItem &item = it->items[i];
        if (!item.cancelled) {
            item.cancelled = true;
            pendingIds.append(item.transferId);
        }
    }

    // A waiting batch does not need a free slot just to report its cancellation
    if (!it->running) {
        waiting_.removeAll(batchId);
        it->running = true;
        scheduleEvent([this, batchId]() { startNextItem(batchId); });
    }

    QPointer<GatewayReply> reply = it->reply;

    for (const QString &id : std::as_const(pendingIds)) {
        markCancelled(id);
    }
    if (reply) {
        reply->abort();
    }
    return true;
}

void TransferExecutor::cancelAll()
{
    const QList<int> ids = batches_.keys();
    for (int batchId : ids) {
        cancelBatch(batchId);
    }
}

void TransferExecutor::setMaxConcurrentBatches(int count)
{
    maxConcurrentBatches_ = qMax(0, count);
    scheduleEvent([this]() { dispatchWaiting(); });
}

void TransferExecutor::setProgressThrottle(int stepPercent, int intervalMs)
{
    progressStepPercent_ = qBound(1, stepPercent, 100);
    progressIntervalMs_ = qMax(0, intervalMs);
}

int TransferExecutor::runningBatchCount() const
{
    int running = 0;
    for (const Batch &batch : batches_) {
        if (batch.running) {
            running++;
        }
    }
    return running;
}

QStringList TransferExecutor::transferIds(int batchId) const
{
    QStringList ids;
    auto it = batches_.constFind(batchId);
    if (it == batches_.constEnd()) {
        return ids;
    }
    for (const BatchItem &item : it->items) {
        ids.append(item.transferId);
    }
    return ids;
}
