#ifndef INVALIDATIONBRIDGE_H
#define INVALIDATIONBRIDGE_H

#include <QObject>
#include <QString>

class ListingCache;

/**
 * @brief Mutations that make a bucket listing out of date.
 */
enum class MutationKind {
    Upload,
    Delete,
    Rename,
    CreateFolder,
    Copy
};

/// @brief Convert MutationKind to string for logging
[[nodiscard]] inline const char* mutationKindToString(MutationKind kind) {
    switch (kind) {
        case MutationKind::Upload: return "upload";
        case MutationKind::Delete: return "delete";
        case MutationKind::Rename: return "rename";
        case MutationKind::CreateFolder: return "create-folder";
        case MutationKind::Copy: return "copy";
    }
    return "unknown";
}

/**
 * @brief Tells listing caches that a (connection, bucket) changed.
 *
 * Invalidation is bucket-wide: whichever prefix was touched, every cached
 * prefix of that bucket is dropped. The bridge only knows about caches
 * through its scopeStale() signal, so neither the executor nor the caches
 * depend on each other.
 */
class InvalidationBridge : public QObject
{
    Q_OBJECT

public:
    explicit InvalidationBridge(QObject *parent = nullptr);
    ~InvalidationBridge() override;

    /**
     * @brief Connects scopeStale() to ListingCache::invalidate().
     *
     * The connection ends when either object is destroyed.
     */
    void attachCache(ListingCache *cache);

    /**
     * @brief Reports a completed mutation.
     */
    void notifyMutation(const QString &connectionId, const QString &bucket, MutationKind kind);

    [[nodiscard]] int notificationCount() const { return notificationCount_; }

signals:
    void scopeStale(const QString &connectionId, const QString &bucket);

private:
    int notificationCount_ = 0;
};

#endif // INVALIDATIONBRIDGE_H
