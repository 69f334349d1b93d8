#include "invalidationbridge.h"
#include "models/listingcache.h"
#include "utils/logging.h"

InvalidationBridge::InvalidationBridge(QObject *parent)
    : QObject(parent)
{
}

InvalidationBridge::~InvalidationBridge() = default;

void InvalidationBridge::attachCache(ListingCache *cache)
{
    if (!cache) {
        return;
    }
    connect(this, &InvalidationBridge::scopeStale, cache, &ListingCache::invalidate);
}

void InvalidationBridge::notifyMutation(const QString &connectionId, const QString &bucket,
                                        MutationKind kind)
{
    ++notificationCount_;
    LOG_VERBOSE() << "InvalidationBridge:" << mutationKindToString(kind)
                  << "in" << connectionId << bucket;
    emit scopeStale(connectionId, bucket);
}
