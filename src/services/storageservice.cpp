#include "storageservice.h"
#include "connectionhealthstore.h"
#include "gatewayreply.h"
#include "invalidationbridge.h"
#include "istoragegateway.h"
#include "utils/logging.h"

#include <QDir>
#include <QFileInfo>

StorageService::StorageService(IStorageGateway *gateway,
                               TransferExecutor *executor,
                               InvalidationBridge *bridge,
                               ConnectionHealthStore *health,
                               QObject *parent)
    : QObject(parent)
    , gateway_(gateway)
    , executor_(executor)
    , bridge_(bridge)
    , health_(health)
{
    connect(executor_, &TransferExecutor::batchFinished,
            this, &StorageService::onBatchFinished);
    connect(executor_, &TransferExecutor::transferSucceeded,
            this, &StorageService::onTransferSucceeded);
    connect(executor_, &TransferExecutor::transferFailed,
            this, &StorageService::onTransferFailed);
    connect(executor_, &TransferExecutor::transferCancelled,
            this, &StorageService::onTransferCancelled);
}

StorageService::~StorageService()
{
    for (const QPointer<GatewayReply> &reply : std::as_const(pending_)) {
        if (reply) {
            disconnect(reply, nullptr, this, nullptr);
            reply->abort();
            reply->deleteLater();
        }
    }
}

QString StorageService::joinKey(const QString &prefix, const QString &name)
{
    if (prefix.isEmpty()) {
        return name;
    }
    return prefix.endsWith('/') ? prefix + name : prefix + '/' + name;
}

int StorageService::uploadFiles(const QString &connectionId, const QString &bucket,
                                const QString &prefix, const QStringList &localPaths)
{
    QList<TransferRequest> requests;
    for (const QString &localPath : localPaths) {
        QFileInfo fileInfo(localPath);

        TransferRequest request;
        request.type = TransferType::Upload;
        request.localPath = localPath;
        request.bucket = bucket;
        request.key = joinKey(prefix, fileInfo.fileName());
        request.fileName = fileInfo.fileName();
        requests.append(request);
    }

    const int batchId = executor_->submitBatch(connectionId, requests);
    if (batchId < 0) {
        return -1;
    }

    rememberBatch(batchId, TransferType::Upload, connectionId);
    emit statusMessage(tr("Queued upload of %n file(s) to %1", nullptr, requests.size())
                           .arg(bucket + '/' + prefix), 3000);
    return batchId;
}

int StorageService::downloadObjects(const QString &connectionId, const QString &bucket,
                                    const QStringList &keys, const QString &localDir)
{
    QList<TransferRequest> requests;
    for (const QString &key : keys) {
        const QString fileName = key.section('/', -1);
        if (fileName.isEmpty()) {
            // Folder markers have nothing to download
            continue;
        }

        TransferRequest request;
        request.type = TransferType::Download;
        request.localPath = QDir(localDir).filePath(fileName);
        request.bucket = bucket;
        request.key = key;
        request.fileName = fileName;
        requests.append(request);
    }

    const int batchId = executor_->submitBatch(connectionId, requests);
    if (batchId < 0) {
        return -1;
    }

    rememberBatch(batchId, TransferType::Download, connectionId);
    emit statusMessage(tr("Queued download of %n file(s) to %1", nullptr, requests.size())
                           .arg(localDir), 3000);
    return batchId;
}

void StorageService::rememberBatch(int batchId, TransferType type, const QString &connectionId)
{
    batchTypes_.insert(batchId, type);
    const QStringList ids = executor_->transferIds(batchId);
    for (const QString &id : ids) {
        transferConnections_.insert(id, connectionId);
    }
}

bool StorageService::deleteObjects(const QString &connectionId, const QString &bucket,
                                   const QStringList &keys)
{
    if (keys.isEmpty()) {
        return false;
    }

    GatewayReply *reply = gateway_->deleteObjects(connectionId, bucket, keys);
    watch(reply, connectionId, bucket, keys.first(), [this, connectionId, bucket, keys](GatewayReply *) {
        if (bridge_) {
            bridge_->notifyMutation(connectionId, bucket, MutationKind::Delete);
        }
        emit objectsDeleted(connectionId, bucket, keys);
        emit statusMessage(tr("Successfully deleted %n object(s)", nullptr, keys.size()), 3000);
    });
    return true;
}

bool StorageService::renameObject(const QString &connectionId, const QString &bucket,
                                  const QString &oldKey, const QString &newKey)
{
    if (oldKey.isEmpty() || newKey.isEmpty() || oldKey == newKey) {
        return false;
    }

    GatewayReply *copy = gateway_->copyObject(connectionId, bucket, oldKey, newKey);
    watch(copy, connectionId, bucket, oldKey, [this, connectionId, bucket, oldKey, newKey](GatewayReply *) {
        GatewayReply *remove = gateway_->deleteObjects(connectionId, bucket, {oldKey});

        // The copy already changed the bucket, whatever happens to the delete
        connect(remove, &GatewayReply::finished, this, [this, remove, connectionId, bucket]() {
            if (remove->hasError() && bridge_) {
                bridge_->notifyMutation(connectionId, bucket, MutationKind::Copy);
            }
        });

        watch(remove, connectionId, bucket, oldKey, [this, connectionId, bucket, oldKey, newKey](GatewayReply *) {
            if (bridge_) {
                bridge_->notifyMutation(connectionId, bucket, MutationKind::Rename);
            }
            emit objectRenamed(connectionId, bucket, oldKey, newKey);
            emit statusMessage(tr("Renamed %1 to %2").arg(oldKey, newKey), 3000);
        });
    });
    return true;
}

bool StorageService::createFolder(const QString &connectionId, const QString &bucket,
                                  const QString &prefix, const QString &folderName)
{
    QString name = folderName.trimmed();
    while (name.endsWith('/')) {
        name.chop(1);
    }
    if (name.isEmpty()) {
        return false;
    }

    const QString folderKey = joinKey(prefix, name) + '/';
    GatewayReply *reply = gateway_->createFolder(connectionId, bucket, folderKey);
    watch(reply, connectionId, bucket, folderKey, [this, connectionId, bucket, folderKey, name](GatewayReply *) {
        if (bridge_) {
            bridge_->notifyMutation(connectionId, bucket, MutationKind::CreateFolder);
        }
        emit folderCreated(connectionId, bucket, folderKey);
        emit statusMessage(tr("Successfully created folder \"%1\"").arg(name), 3000);
    });
    return true;
}

bool StorageService::presignUrl(const QString &connectionId, const QString &bucket, const QString &key)
{
    return presignUrl(connectionId, bucket, key, defaultPresignTtl_);
}

bool StorageService::presignUrl(const QString &connectionId, const QString &bucket,
                                const QString &key, int ttlSeconds)
{
    if (key.isEmpty()) {
        return false;
    }

    GatewayReply *reply = gateway_->presignUrl(connectionId, bucket, key, ttlSeconds);
    watch(reply, connectionId, bucket, key, [this, connectionId, bucket, key](GatewayReply *finished) {
        emit presignedUrlReady(connectionId, bucket, key, finished->url());
    });
    return true;
}

bool StorageService::fetchMetadata(const QString &connectionId, const QString &bucket, const QString &key)
{
    if (key.isEmpty()) {
        return false;
    }

    GatewayReply *reply = gateway_->headMetadata(connectionId, bucket, key);
    watch(reply, connectionId, bucket, key, [this, connectionId, bucket](GatewayReply *finished) {
        emit metadataReady(connectionId, bucket, finished->metadata());
    });
    return true;
}

int StorageService::pendingOperationCount() const
{
    int count = 0;
    for (const QPointer<GatewayReply> &reply : pending_) {
        if (reply && !reply->isFinished()) {
            count++;
        }
    }
    return count;
}

void StorageService::watch(GatewayReply *reply, const QString &connectionId, const QString &bucket,
                           const QString &key, const SuccessHandler &onSuccess)
{
    pending_.append(reply);

    connect(reply, &GatewayReply::finished, this,
            [this, reply, connectionId, bucket, key, onSuccess]() {
        pending_.removeAll(reply);
        reply->deleteLater();

        recordOutcome(connectionId, reply->error());

        if (reply->hasError()) {
            qWarning() << "StorageService:" << reply->operation() << "failed for"
                       << bucket << key << ":" << reply->errorString();
            emit operationFailed(connectionId, bucket, key, reply->errorString());
            emit statusMessage(reply->errorString(), 5000);
        } else {
            onSuccess(reply);
        }

        checkIdle();
    });
}

void StorageService::recordOutcome(const QString &connectionId, const GatewayError &error)
{
    if (!health_ || error.kind == GatewayErrorKind::Cancelled) {
        return;
    }

    if (!error.isError()) {
        health_->setHealth(connectionId, ConnectionHealth::Healthy);
    } else if (error.affectsConnectionHealth()) {
        health_->setHealth(connectionId, ConnectionHealth::Unhealthy);
    }
}

void StorageService::onTransferSucceeded(const QString &transferId)
{
    recordOutcome(transferConnections_.take(transferId), GatewayError());
}

void StorageService::onTransferFailed(const QString &transferId, const QString &errorMessage,
                                      GatewayErrorKind kind)
{
    recordOutcome(transferConnections_.take(transferId), GatewayError{kind, errorMessage});
}

void StorageService::onTransferCancelled(const QString &transferId)
{
    transferConnections_.remove(transferId);
}

void StorageService::onBatchFinished(const BatchResult &result)
{
    if (!batchTypes_.contains(result.batchId)) {
        return;
    }
    const TransferType type = batchTypes_.take(result.batchId);

    QString message;
    if (type == TransferType::Upload) {
        if (result.succeeded > 0) {
            message = tr("Successfully uploaded %n file(s)", nullptr, result.succeeded);
            if (result.failed > 0) {
                message += tr(", %n failed", nullptr, result.failed);
            }
        } else if (result.failed > 0) {
            message = tr("Failed to upload %n file(s)", nullptr, result.failed);
        }
    } else {
        if (result.succeeded > 0) {
            message = tr("Successfully downloaded %n file(s)", nullptr, result.succeeded);
            if (result.failed > 0) {
                message += tr(", %n failed", nullptr, result.failed);
            }
        } else if (result.failed > 0) {
            message = tr("Failed to download %n file(s)", nullptr, result.failed);
        }
    }

    if (message.isEmpty() && result.cancelled > 0) {
        message = tr("Cancelled %n transfer(s)", nullptr, result.cancelled);
    }

    LOG_VERBOSE() << "StorageService: batch" << result.batchId << "done:" << message;

    emit transfersFinished(result.batchId, type, result.succeeded, result.failed);
    if (!message.isEmpty()) {
        emit statusMessage(message, 5000);
    }

    checkIdle();
}

void StorageService::checkIdle()
{
    if (pendingOperationCount() == 0 && batchTypes_.isEmpty()) {
        emit idle();
    }
}
