#ifndef TRANSFERQUEUE_H
#define TRANSFERQUEUE_H

#include <QAbstractListModel>
#include <QDateTime>
#include <QList>
#include <QMutex>
#include <QString>
#include <optional>

enum class TransferType { Upload, Download };

/**
 * @brief Lifecycle of a transfer record.
 *
 * Records move forward only: Queued -> InProgress -> one of the terminal
 * states. Terminal states are absorbing; a terminal record only leaves the
 * queue by removal.
 */
enum class TransferStatus {
    Queued,       ///< Waiting for the executor
    InProgress,   ///< Gateway call outstanding
    Completed,    ///< Finished successfully
    Failed,       ///< Gateway reported an error
    Cancelled     ///< Abandoned by the user
};

/// @brief Convert TransferStatus to string for debugging
[[nodiscard]] inline const char* transferStatusToString(TransferStatus status) {
    switch (status) {
        case TransferStatus::Queued: return "queued";
        case TransferStatus::InProgress: return "in_progress";
        case TransferStatus::Completed: return "completed";
        case TransferStatus::Failed: return "failed";
        case TransferStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] inline bool isTerminalStatus(TransferStatus status) {
    return status == TransferStatus::Completed
        || status == TransferStatus::Failed
        || status == TransferStatus::Cancelled;
}

/**
 * @brief What the caller knows about a transfer when it is enqueued.
 */
struct TransferDescriptor {
    TransferType type = TransferType::Upload;
    QString fileName;
    QString bucket;
    QString key;
    qint64 totalBytes = 0;  // 0 when the size is not known yet
};

struct TransferRecord {
    QString id;
    TransferType type = TransferType::Upload;
    QString fileName;
    QString bucket;
    QString key;
    TransferStatus status = TransferStatus::Queued;
    int progress = 0;  // Percent, 0-100
    qint64 bytesTransferred = 0;
    qint64 totalBytes = 0;
    QString errorMessage;
    QDateTime startedAt;
    QDateTime completedAt;
};

/**
 * @brief Partial record fields merged by TransferQueue::update().
 *
 * Unset fields are left untouched.
 */
struct TransferUpdate {
    std::optional<TransferStatus> status;
    std::optional<int> progress;
    std::optional<qint64> bytesTransferred;
    std::optional<qint64> totalBytes;
    std::optional<QString> errorMessage;
    std::optional<QDateTime> startedAt;
    std::optional<QDateTime> completedAt;
};

/**
 * @brief Authoritative in-memory collection of transfer records.
 *
 * The queue is the only writer of record state. All mutations run on the
 * thread that owns the queue (calls from other threads are marshalled there
 * and block until applied), which makes them linearizable. Read accessors
 * return copies and may be called from any thread.
 *
 * Observers subscribe to the change signals with a context object so the
 * subscription ends with the observer's lifetime.
 */
class TransferQueue : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles {
        IdRole = Qt::UserRole + 1,
        TypeRole,
        FileNameRole,
        BucketRole,
        KeyRole,
        StatusRole,
        ProgressRole,
        BytesTransferredRole,
        TotalBytesRole,
        ErrorMessageRole
    };

    explicit TransferQueue(QObject *parent = nullptr);
    ~TransferQueue() override;

    // Mutations
    QString enqueue(const TransferDescriptor &descriptor);
    bool update(const QString &id, const TransferUpdate &changes);
    bool remove(const QString &id);
    int clearCompleted();
    void clearAll();

    // Reads
    [[nodiscard]] std::optional<TransferRecord> record(const QString &id) const;
    [[nodiscard]] QList<TransferRecord> records() const;
    [[nodiscard]] QList<TransferRecord> activeRecords() const;
    [[nodiscard]] QList<TransferRecord> completedRecords() const;
    [[nodiscard]] int count() const;
    [[nodiscard]] int activeCount() const;
    [[nodiscard]] bool contains(const QString &id) const;

    /**
     * @brief Mean progress of queued and in-progress records.
     * @return 100 when nothing is active.
     */
    [[nodiscard]] double overallProgress() const;

    // Visibility of the queue panel
    [[nodiscard]] bool isVisible() const;
    void setVisible(bool visible);
    void toggleVisible();

    // QAbstractListModel interface
    [[nodiscard]] int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    [[nodiscard]] QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    [[nodiscard]] QHash<int, QByteArray> roleNames() const override;

signals:
    void transferAdded(const QString &id);
    void transferUpdated(const QString &id);
    void transferFinished(const QString &id, TransferStatus status);
    void transferRemoved(const QString &id);
    void queueChanged();
    void visibilityChanged(bool visible);

private:
    [[nodiscard]] bool isOwnerThread() const;
    [[nodiscard]] int findIndexLocked(const QString &id) const;
    [[nodiscard]] static int statusRank(TransferStatus status);
    static void mergeInto(TransferRecord &record, const TransferUpdate &changes);

    mutable QMutex mutex_;
    QList<TransferRecord> records_;
    bool visible_ = false;
};

#endif // TRANSFERQUEUE_H
