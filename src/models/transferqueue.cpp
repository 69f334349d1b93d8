#include "transferqueue.h"
#include "../utils/logging.h"

#include <QMetaObject>
#include <QMutexLocker>
#include <QStringList>
#include <QThread>
#include <QUuid>
#include <utility>

TransferQueue::TransferQueue(QObject *parent)
    : QAbstractListModel(parent)
{
}

TransferQueue::~TransferQueue() = default;

bool TransferQueue::isOwnerThread() const
{
    return QThread::currentThread() == thread();
}

QString TransferQueue::enqueue(const TransferDescriptor &descriptor)
{
    if (!isOwnerThread()) {
        QString id;
        QMetaObject::invokeMethod(this, [this, &id, descriptor]() { id = enqueue(descriptor); },
                                  Qt::BlockingQueuedConnection);
        return id;
    }

    TransferRecord record;
    record.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    record.type = descriptor.type;
    record.fileName = descriptor.fileName;
    record.bucket = descriptor.bucket;
    record.key = descriptor.key;
    record.status = TransferStatus::Queued;
    record.progress = 0;
    record.bytesTransferred = 0;
    record.totalBytes = qMax<qint64>(0, descriptor.totalBytes);

    int row = 0;
    {
        QMutexLocker locker(&mutex_);
        row = records_.size();
    }

    beginInsertRows(QModelIndex(), row, row);
    {
        QMutexLocker locker(&mutex_);
        records_.append(record);
    }
    endInsertRows();

    LOG_VERBOSE() << "TransferQueue: Enqueued" << record.id
                  << (record.type == TransferType::Upload ? "upload" : "download")
                  << record.bucket << record.key;

    emit transferAdded(record.id);
    emit queueChanged();

    setVisible(true);

    return record.id;
}

bool TransferQueue::update(const QString &id, const TransferUpdate &changes)
{
    if (!isOwnerThread()) {
        bool applied = false;
        QMetaObject::invokeMethod(this, [this, &applied, id, changes]() { applied = update(id, changes); },
                                  Qt::BlockingQueuedConnection);
        return applied;
    }

    int row = -1;
    bool becameTerminal = false;
    TransferStatus newStatus = TransferStatus::Queued;
    {
        QMutexLocker locker(&mutex_);
        row = findIndexLocked(id);
        if (row < 0) {
            // The record may have been cleared while its transfer was still
            // running. That is expected, not an error.
            LOG_VERBOSE() << "TransferQueue: update for unknown id ignored:" << id;
            return false;
        }

        TransferRecord &record = records_[row];
        if (isTerminalStatus(record.status)) {
            LOG_VERBOSE() << "TransferQueue: update for terminal record ignored:" << id
                          << transferStatusToString(record.status);
            return false;
        }

        mergeInto(record, changes);
        becameTerminal = isTerminalStatus(record.status);
        newStatus = record.status;
    }

    emit dataChanged(index(row), index(row));
    emit transferUpdated(id);
    if (becameTerminal) {
        emit transferFinished(id, newStatus);
    }
    emit queueChanged();
    return true;
}

bool TransferQueue::remove(const QString &id)
{
    if (!isOwnerThread()) {
        bool removed = false;
        QMetaObject::invokeMethod(this, [this, &removed, id]() { removed = remove(id); },
                                  Qt::BlockingQueuedConnection);
        return removed;
    }

    int row = -1;
    {
        QMutexLocker locker(&mutex_);
        row = findIndexLocked(id);
    }
    if (row < 0) {
        return false;
    }

    beginRemoveRows(QModelIndex(), row, row);
    {
        QMutexLocker locker(&mutex_);
        records_.removeAt(row);
    }
    endRemoveRows();

    emit transferRemoved(id);
    emit queueChanged();
    return true;
}

int TransferQueue::clearCompleted()
{
    if (!isOwnerThread()) {
        int removed = 0;
        QMetaObject::invokeMethod(this, [this, &removed]() { removed = clearCompleted(); },
                                  Qt::BlockingQueuedConnection);
        return removed;
    }

    QStringList removedIds;
    int lastRow = 0;
    {
        QMutexLocker locker(&mutex_);
        lastRow = records_.size() - 1;
    }

    for (int i = lastRow; i >= 0; --i) {
        QString id;
        {
            QMutexLocker locker(&mutex_);
            const TransferRecord &record = records_.at(i);
            // Cancelled is terminal too, so it goes with completed and failed
            if (!isTerminalStatus(record.status)) {
                continue;
            }
            id = record.id;
        }

        beginRemoveRows(QModelIndex(), i, i);
        {
            QMutexLocker locker(&mutex_);
            records_.removeAt(i);
        }
        endRemoveRows();
        removedIds.append(id);
    }

    for (const QString &id : std::as_const(removedIds)) {
        emit transferRemoved(id);
    }
    if (!removedIds.isEmpty()) {
        emit queueChanged();
    }
    return removedIds.size();
}

void TransferQueue::clearAll()
{
    if (!isOwnerThread()) {
        QMetaObject::invokeMethod(this, [this]() { clearAll(); }, Qt::BlockingQueuedConnection);
        return;
    }

    QStringList removedIds;

    beginResetModel();
    {
        QMutexLocker locker(&mutex_);
        for (const TransferRecord &record : std::as_const(records_)) {
            removedIds.append(record.id);
        }
        records_.clear();
    }
    endResetModel();

    // In-flight executor work is not stopped here; its later updates hit
    // missing ids and become no-ops.
    LOG_VERBOSE() << "TransferQueue: Cleared" << removedIds.size() << "records";

    for (const QString &id : std::as_const(removedIds)) {
        emit transferRemoved(id);
    }
    emit queueChanged();
}

std::optional<TransferRecord> TransferQueue::record(const QString &id) const
{
    QMutexLocker locker(&mutex_);
    int row = findIndexLocked(id);
    if (row < 0) {
        return std::nullopt;
    }
    return records_.at(row);
}

QList<TransferRecord> TransferQueue::records() const
{
    QMutexLocker locker(&mutex_);
    return records_;
}

QList<TransferRecord> TransferQueue::activeRecords() const
{
    QMutexLocker locker(&mutex_);
    QList<TransferRecord> active;
    for (const TransferRecord &record : records_) {
        if (record.status == TransferStatus::Queued ||
            record.status == TransferStatus::InProgress) {
            active.append(record);
        }
    }
    return active;
}

QList<TransferRecord> TransferQueue::completedRecords() const
{
    QMutexLocker locker(&mutex_);
    QList<TransferRecord> done;
    for (const TransferRecord &record : records_) {
        if (isTerminalStatus(record.status)) {
            done.append(record);
        }
    }
    return done;
}

int TransferQueue::count() const
{
    QMutexLocker locker(&mutex_);
    return records_.size();
}

int TransferQueue::activeCount() const
{
    return activeRecords().size();
}

bool TransferQueue::contains(const QString &id) const
{
    QMutexLocker locker(&mutex_);
    return findIndexLocked(id) >= 0;
}

double TransferQueue::overallProgress() const
{
    const QList<TransferRecord> active = activeRecords();
    if (active.isEmpty()) {
        return 100.0;
    }

    double total = 0.0;
    for (const TransferRecord &record : active) {
        total += record.progress;
    }
    return total / active.size();
}

bool TransferQueue::isVisible() const
{
    QMutexLocker locker(&mutex_);
    return visible_;
}

void TransferQueue::setVisible(bool visible)
{
    {
        QMutexLocker locker(&mutex_);
        if (visible_ == visible) {
            return;
        }
        visible_ = visible;
    }
    emit visibilityChanged(visible);
}

void TransferQueue::toggleVisible()
{
    setVisible(!isVisible());
}

int TransferQueue::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return count();
}

QVariant TransferQueue::data(const QModelIndex &index, int role) const
{
    QMutexLocker locker(&mutex_);
    if (!index.isValid() || index.row() >= records_.size()) {
        return QVariant();
    }

    const TransferRecord &record = records_.at(index.row());

    switch (role) {
    case Qt::DisplayRole:
    case FileNameRole:
        return record.fileName;
    case IdRole:
        return record.id;
    case TypeRole:
        return static_cast<int>(record.type);
    case BucketRole:
        return record.bucket;
    case KeyRole:
        return record.key;
    case StatusRole:
        return static_cast<int>(record.status);
    case ProgressRole:
        return record.progress;
    case BytesTransferredRole:
        return record.bytesTransferred;
    case TotalBytesRole:
        return record.totalBytes;
    case ErrorMessageRole:
        return record.errorMessage;
    }

    return QVariant();
}

QHash<int, QByteArray> TransferQueue::roleNames() const
{
    QHash<int, QByteArray> roles;
    roles[IdRole] = "id";
    roles[TypeRole] = "type";
    roles[FileNameRole] = "fileName";
    roles[BucketRole] = "bucket";
    roles[KeyRole] = "key";
    roles[StatusRole] = "status";
    roles[ProgressRole] = "progress";
    roles[BytesTransferredRole] = "bytesTransferred";
    roles[TotalBytesRole] = "totalBytes";
    roles[ErrorMessageRole] = "error";
    return roles;
}

int TransferQueue::findIndexLocked(const QString &id) const
{
    for (int i = 0; i < records_.size(); ++i) {
        if (records_[i].id == id) {
            return i;
        }
    }
    return -1;
}

int TransferQueue::statusRank(TransferStatus status)
{
    switch (status) {
    case TransferStatus::Queued: return 0;
    case TransferStatus::InProgress: return 1;
    case TransferStatus::Completed:
    case TransferStatus::Failed:
    case TransferStatus::Cancelled:
        return 2;
    }
    return 0;
}

void TransferQueue::mergeInto(TransferRecord &record, const TransferUpdate &changes)
{
    if (changes.status) {
        if (statusRank(*changes.status) < statusRank(record.status)) {
            qWarning() << "TransferQueue: Refusing backwards transition for" << record.id
                       << transferStatusToString(record.status) << "->"
                       << transferStatusToString(*changes.status);
        } else {
            record.status = *changes.status;
        }
    }

    // totalBytes first so a combined update clamps against the new total
    if (changes.totalBytes) {
        record.totalBytes = qMax<qint64>(0, *changes.totalBytes);
    }
    if (changes.bytesTransferred) {
        record.bytesTransferred = qMax<qint64>(0, *changes.bytesTransferred);
    }
    if (record.totalBytes > 0 && record.bytesTransferred > record.totalBytes) {
        record.bytesTransferred = record.totalBytes;
    }

    if (changes.progress) {
        int progress = qBound(0, *changes.progress, 100);
        if (progress > record.progress) {
            record.progress = progress;
        }
    }

    if (changes.errorMessage) {
        record.errorMessage = *changes.errorMessage;
    }
    if (changes.startedAt) {
        record.startedAt = *changes.startedAt;
    }
    if (changes.completedAt) {
        record.completedAt = *changes.completedAt;
    }
}
