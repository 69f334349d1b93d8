#ifndef LISTINGCACHE_H
#define LISTINGCACHE_H

#include <QDateTime>
#include <QHash>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QQueue>
#include <QString>
#include <optional>

#include "services/storageentry.h"

class GatewayReply;
class IStorageGateway;

/**
 * @brief Identity of one independent pagination sequence.
 */
struct ListingScope {
    QString connectionId;
    QString bucket;
    QString prefix;

    [[nodiscard]] bool matches(const QString &otherConnectionId, const QString &otherBucket) const {
        return connectionId == otherConnectionId && bucket == otherBucket;
    }
};

inline bool operator==(const ListingScope &a, const ListingScope &b)
{
    return a.connectionId == b.connectionId && a.bucket == b.bucket && a.prefix == b.prefix;
}

inline bool operator!=(const ListingScope &a, const ListingScope &b)
{
    return !(a == b);
}

inline size_t qHash(const ListingScope &scope, size_t seed = 0)
{
    return qHashMulti(seed, scope.connectionId, scope.bucket, scope.prefix);
}

/**
 * @brief Flattened, read-only view of every page fetched so far for a scope.
 */
struct ListingSnapshot {
    QList<ObjectEntry> objects;   ///< All pages concatenated in fetch order
    QStringList prefixes;         ///< Deduplicated across pages, first-seen order
    bool isTruncated = false;     ///< Truncation flag of the last fetched page
    int pageCount = 0;
};

/**
 * @brief Paginated, per-scope cache of bucket listings.
 *
 * Pages for one scope are fetched strictly in sequence because page N needs
 * the continuation token of page N-1. Different scopes fetch independently.
 *
 * Every scope carries a generation counter. invalidate() bumps it and drops
 * the cached pages; a reply that was in flight under an older generation is
 * discarded instead of being appended to the fresh sequence. A scope with no
 * pages, no requests and no outstanding replies is released entirely, so the
 * cache only holds state for prefixes that still need it.
 *
 * Results are delivered by signal. A request for a page that is already
 * cached resolves immediately from the cache.
 *
 * @par Example usage:
 * @code
 * ListingCache *cache = new ListingCache(gateway, this);
 * connect(cache, &ListingCache::pageReady, this, &Browser::onPageReady);
 * connect(cache, &ListingCache::fetchFailed, this, &Browser::onFetchFailed);
 *
 * ListingScope scope{"conn-1", "photos", "2024/"};
 * cache->fetchPage(scope, 0, 500);
 * // ... later, when the user scrolls to the end
 * cache->fetchNextPage(scope, 500);
 * @endcode
 */
class ListingCache : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultPageSize = 500;
    static constexpr int MaxPageSize = 1000;

    explicit ListingCache(IStorageGateway *gateway, QObject *parent = nullptr);
    ~ListingCache() override;

    /**
     * @brief Requests page @p pageIndex of @p scope.
     *
     * Missing pages before @p pageIndex are fetched first, in order. The
     * result arrives through pageReady() or fetchFailed().
     */
    void fetchPage(const ListingScope &scope, int pageIndex, int pageSize = DefaultPageSize);

    /**
     * @brief Fetches the page after the last cached one.
     * @return False if the listing is complete or a fetch is already running.
     */
    bool fetchNextPage(const ListingScope &scope, int pageSize = DefaultPageSize);

    [[nodiscard]] ListingSnapshot flatten(const ListingScope &scope) const;
    [[nodiscard]] bool hasMore(const ListingScope &scope) const;
    [[nodiscard]] int pageCount(const ListingScope &scope) const;
    [[nodiscard]] std::optional<ListingPage> page(const ListingScope &scope, int pageIndex) const;
    [[nodiscard]] bool isFetching(const ListingScope &scope) const;
    [[nodiscard]] quint64 generation(const ListingScope &scope) const;

    /**
     * @brief Number of scopes the cache currently holds state for.
     */
    [[nodiscard]] int scopeCount() const { return static_cast<int>(scopes_.size()); }

    /**
     * @brief Set the cache TTL (time-to-live) in seconds.
     * @param seconds TTL in seconds. Use 0 to disable TTL (infinite cache).
     *
     * Default is 30 seconds. A page-0 request for a scope fetched longer ago
     * than this restarts the sequence.
     */
    void setCacheTtl(int seconds) { cacheTtlSeconds_ = seconds; }
    [[nodiscard]] int cacheTtl() const { return cacheTtlSeconds_; }

    /**
     * @brief Check if a scope's pages are older than the TTL.
     */
    [[nodiscard]] bool isStale(const ListingScope &scope) const;

public slots:
    /**
     * @brief Discards cached pages for every prefix under (connection, bucket).
     */
    void invalidate(const QString &connectionId, const QString &bucket);

    /**
     * @brief Discards every cached scope.
     */
    void invalidateAll();

signals:
    void pageReady(const ListingScope &scope, int pageIndex, const ListingPage &page);
    void fetchFailed(const ListingScope &scope, int pageIndex, const QString &message);
    void stalePageDiscarded(const ListingScope &scope, int pageIndex);
    void scopeInvalidated(const QString &connectionId, const QString &bucket);
    void loadingStarted(const ListingScope &scope);
    void loadingFinished(const ListingScope &scope);

private:
    struct PendingFetch {
        int pageIndex = 0;
        int pageSize = DefaultPageSize;
    };

    struct ScopeState {
        QList<ListingPage> pages;
        quint64 generation = 0;
        QDateTime fetchedAt;
        QQueue<PendingFetch> pending;
        QPointer<GatewayReply> inFlight;
        int inFlightIndex = -1;
        int staleReplies = 0;  // Replies of older generations still outstanding
    };

    void pump(const ListingScope &scope);
    void onReplyFinished(const ListingScope &scope, GatewayReply *reply,
                         int pageIndex, quint64 generation);
    void discardScope(const ListingScope &scope, ScopeState &state);
    void releaseIfIdle(const ListingScope &scope);

    IStorageGateway *gateway_ = nullptr;
    QHash<ListingScope, ScopeState> scopes_;

    // Cache TTL in seconds (0 = infinite, no automatic expiry)
    int cacheTtlSeconds_ = 30;
};

#endif // LISTINGCACHE_H
