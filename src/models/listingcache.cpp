#include "listingcache.h"
#include "services/gatewayreply.h"
#include "services/istoragegateway.h"
#include "utils/logging.h"

#include <QSet>
#include <utility>

ListingCache::ListingCache(IStorageGateway *gateway, QObject *parent)
    : QObject(parent)
    , gateway_(gateway)
{
}

ListingCache::~ListingCache()
{
    // Replies still in flight must not call back into a destroyed cache
    for (auto it = scopes_.begin(); it != scopes_.end(); ++it) {
        if (it->inFlight) {
            disconnect(it->inFlight, nullptr, this, nullptr);
            it->inFlight->abort();
            it->inFlight->deleteLater();
        }
    }
}

void ListingCache::fetchPage(const ListingScope &scope, int pageIndex, int pageSize)
{
    if (pageIndex < 0) {
        emit fetchFailed(scope, pageIndex, tr("Invalid page index %1").arg(pageIndex));
        return;
    }

    pageSize = qBound(1, pageSize, MaxPageSize);

    {
        ScopeState &state = scopes_[scope];

        // A stale listing is refetched from the top rather than extended
        if (pageIndex == 0 && !state.pages.isEmpty() && !state.inFlight && isStale(scope)) {
            LOG_VERBOSE() << "ListingCache: scope stale, restarting" << scope.bucket << scope.prefix;
            discardScope(scope, state);
        }
    }

    // discardScope() emits signals, so look the state up again
    scopes_[scope].pending.enqueue(PendingFetch{pageIndex, pageSize});
    pump(scope);
}

bool ListingCache::fetchNextPage(const ListingScope &scope, int pageSize)
{
    if (isFetching(scope)) {
        return false;
    }

    auto it = scopes_.constFind(scope);
    int nextIndex = 0;
    if (it != scopes_.constEnd() && !it->pages.isEmpty()) {
        if (!it->pages.last().isTruncated) {
            return false;
        }
        nextIndex = it->pages.size();
    }

    fetchPage(scope, nextIndex, pageSize);
    return true;
}

void ListingCache::pump(const ListingScope &scope)
{
    // Signal handlers may touch other scopes and rehash scopes_, so the state
    // is looked up again on every pass.
    forever {
        auto it = scopes_.find(scope);
        if (it == scopes_.end() || it->inFlight || it->pending.isEmpty()) {
            return;
        }

        const PendingFetch request = it->pending.head();

        if (request.pageIndex < it->pages.size()) {
            it->pending.dequeue();
            const ListingPage cached = it->pages.at(request.pageIndex);
            emit pageReady(scope, request.pageIndex, cached);
            continue;
        }

        if (!it->pages.isEmpty() && !it->pages.last().isTruncated) {
            it->pending.dequeue();
            emit fetchFailed(scope, request.pageIndex, tr("No more pages"));
            continue;
        }

        if (!gateway_) {
            it->pending.clear();
            emit fetchFailed(scope, request.pageIndex, tr("No storage gateway"));
            return;
        }

        const int fetchIndex = it->pages.size();
        const QString token = it->pages.isEmpty() ? QString()
                                                  : it->pages.last().continuationToken;
        const quint64 generation = it->generation;

        LOG_VERBOSE() << "ListingCache: fetching page" << fetchIndex << "of"
                      << scope.bucket << scope.prefix << "generation" << generation;

        GatewayReply *reply = gateway_->listObjects(scope.connectionId, scope.bucket,
                                                    scope.prefix, token, request.pageSize);
        it->inFlight = reply;
        it->inFlightIndex = fetchIndex;

        connect(reply, &GatewayReply::finished, this,
                [this, scope, reply, fetchIndex, generation]() {
            onReplyFinished(scope, reply, fetchIndex, generation);
        });

        emit loadingStarted(scope);
        return;
    }
}

void ListingCache::onReplyFinished(const ListingScope &scope, GatewayReply *reply,
                                   int pageIndex, quint64 generation)
{
    reply->deleteLater();

    auto it = scopes_.find(scope);
    if (it == scopes_.end() || it->generation != generation) {
        // Invalidated while the request was outstanding
        LOG_VERBOSE() << "ListingCache: discarding page" << pageIndex << "of"
                      << scope.bucket << scope.prefix << "from generation" << generation;
        if (it != scopes_.end() && it->staleReplies > 0) {
            it->staleReplies--;
        }
        emit stalePageDiscarded(scope, pageIndex);
        releaseIfIdle(scope);
        return;
    }

    if (it->inFlight == reply) {
        it->inFlight = nullptr;
        it->inFlightIndex = -1;
    }

    if (reply->hasError()) {
        const QString message = reply->errorString();
        qWarning() << "ListingCache: listing failed for" << scope.bucket << scope.prefix
                   << "page" << pageIndex << ":" << message;

        // Every queued request depends on the page that failed
        const QQueue<PendingFetch> failed = it->pending;
        it->pending.clear();

        emit loadingFinished(scope);
        for (const PendingFetch &request : failed) {
            emit fetchFailed(scope, request.pageIndex, message);
        }
        return;
    }

    const ListingPage page = reply->listingPage();
    it->pages.append(page);
    if (pageIndex == 0) {
        it->fetchedAt = QDateTime::currentDateTime();
    }

    // Requests for exactly this page are answered by the pageReady below
    QQueue<PendingFetch> remaining;
    for (const PendingFetch &request : std::as_const(it->pending)) {
        if (request.pageIndex != pageIndex) {
            remaining.enqueue(request);
        }
    }
    it->pending = remaining;

    emit loadingFinished(scope);
    emit pageReady(scope, pageIndex, page);

    pump(scope);
}

ListingSnapshot ListingCache::flatten(const ListingScope &scope) const
{
    ListingSnapshot snapshot;

    auto it = scopes_.constFind(scope);
    if (it == scopes_.constEnd()) {
        return snapshot;
    }

    QSet<QString> seenPrefixes;
    for (const ListingPage &page : it->pages) {
        snapshot.objects.append(page.objects);
        for (const QString &prefix : page.prefixes) {
            if (!seenPrefixes.contains(prefix)) {
                seenPrefixes.insert(prefix);
                snapshot.prefixes.append(prefix);
            }
        }
    }

    snapshot.pageCount = it->pages.size();
    snapshot.isTruncated = !it->pages.isEmpty() && it->pages.last().isTruncated;
    return snapshot;
}

bool ListingCache::hasMore(const ListingScope &scope) const
{
    auto it = scopes_.constFind(scope);
    if (it == scopes_.constEnd() || it->pages.isEmpty()) {
        return false;
    }
    return it->pages.last().isTruncated;
}

int ListingCache::pageCount(const ListingScope &scope) const
{
    auto it = scopes_.constFind(scope);
    return it == scopes_.constEnd() ? 0 : it->pages.size();
}

std::optional<ListingPage> ListingCache::page(const ListingScope &scope, int pageIndex) const
{
    auto it = scopes_.constFind(scope);
    if (it == scopes_.constEnd() || pageIndex < 0 || pageIndex >= it->pages.size()) {
        return std::nullopt;
    }
    return it->pages.at(pageIndex);
}

bool ListingCache::isFetching(const ListingScope &scope) const
{
    auto it = scopes_.constFind(scope);
    return it != scopes_.constEnd() && !it->inFlight.isNull();
}

quint64 ListingCache::generation(const ListingScope &scope) const
{
    auto it = scopes_.constFind(scope);
    return it == scopes_.constEnd() ? 0 : it->generation;
}

bool ListingCache::isStale(const ListingScope &scope) const
{
    // TTL of 0 means cache never expires
    if (cacheTtlSeconds_ <= 0) {
        return false;
    }

    auto it = scopes_.constFind(scope);
    if (it == scopes_.constEnd() || !it->fetchedAt.isValid()) {
        return false;
    }

    return it->fetchedAt.secsTo(QDateTime::currentDateTime()) >= cacheTtlSeconds_;
}

void ListingCache::invalidate(const QString &connectionId, const QString &bucket)
{
    QList<ListingScope> matching;
    for (auto it = scopes_.constBegin(); it != scopes_.constEnd(); ++it) {
        if (it.key().matches(connectionId, bucket)) {
            matching.append(it.key());
        }
    }

    LOG_VERBOSE() << "ListingCache: invalidating" << matching.size() << "scopes of"
                  << connectionId << bucket;

    for (const ListingScope &scope : std::as_const(matching)) {
        auto it = scopes_.find(scope);
        if (it != scopes_.end()) {
            discardScope(scope, *it);
            releaseIfIdle(scope);
        }
    }

    emit scopeInvalidated(connectionId, bucket);
}

void ListingCache::invalidateAll()
{
    const QList<ListingScope> all = scopes_.keys();
    for (const ListingScope &scope : all) {
        auto it = scopes_.find(scope);
        if (it != scopes_.end()) {
            discardScope(scope, *it);
            releaseIfIdle(scope);
        }
    }
}

void ListingCache::discardScope(const ListingScope &scope, ScopeState &state)
{
    ++state.generation;
    state.pages.clear();
    state.fetchedAt = QDateTime();

    // The outstanding reply keeps running; its result is dropped on arrival
    // because its generation no longer matches.
    const bool wasFetching = !state.inFlight.isNull();
    const int inFlightIndex = wasFetching ? state.inFlightIndex : -1;
    state.inFlight = nullptr;
    state.inFlightIndex = -1;
    if (wasFetching) {
        state.staleReplies++;
    }

    const QQueue<PendingFetch> dropped = state.pending;
    state.pending.clear();

    if (wasFetching) {
        emit loadingFinished(scope);
    }
    for (const PendingFetch &request : dropped) {
        // The in-flight page reports itself when its reply arrives
        if (request.pageIndex != inFlightIndex) {
            emit stalePageDiscarded(scope, request.pageIndex);
        }
    }
}

void ListingCache::releaseIfIdle(const ListingScope &scope)
{
    auto it = scopes_.find(scope);
    if (it == scopes_.end()) {
        return;
    }

    // The generation restarts with the next fetch, which is only safe once no
    // reply of an older generation can still arrive.
    if (it->pages.isEmpty() && it->pending.isEmpty() && !it->inFlight
        && it->staleReplies == 0) {
        LOG_VERBOSE() << "ListingCache: releasing scope" << scope.bucket << scope.prefix;
        scopes_.erase(it);
    }
}
