#include "transfersettings.h"
#include "models/listingcache.h"
#include "services/storageservice.h"
#include "services/transferexecutor.h"

#include <QDebug>
#include <QSettings>

namespace {

int readBounded(const QSettings &settings, const QString &key, int defaultValue, int min, int max)
{
    bool ok = false;
    const int value = settings.value(key, defaultValue).toInt(&ok);
    if (!ok) {
        qWarning() << "TransferSettings: ignoring non-numeric" << key
                   << settings.value(key).toString();
        return defaultValue;
    }

    const int bounded = qBound(min, value, max);
    if (bounded != value) {
        qWarning() << "TransferSettings:" << key << value << "out of range, using" << bounded;
    }
    return bounded;
}

} // namespace

TransferSettings TransferSettings::load()
{
    QSettings settings;
    return load(settings);
}

TransferSettings TransferSettings::load(const QSettings &settings)
{
    TransferSettings result;
    result.pageSize = readBounded(settings, "listing/pageSize",
                                  result.pageSize, 1, ListingCache::MaxPageSize);
    result.cacheTtlSeconds = readBounded(settings, "listing/cacheTtlSeconds",
                                         result.cacheTtlSeconds, 0, 86400);
    result.maxConcurrentBatches = readBounded(settings, "transfers/maxConcurrentBatches",
                                              result.maxConcurrentBatches, 0, 64);
    result.progressIntervalMs = readBounded(settings, "transfers/progressIntervalMs",
                                            result.progressIntervalMs, 0, 10000);
    result.progressStepPercent = readBounded(settings, "transfers/progressStepPercent",
                                             result.progressStepPercent, 1, 100);
    result.presignTtlSeconds = readBounded(settings, "sharing/presignTtlSeconds",
                                           result.presignTtlSeconds, 1, 604800);
    return result;
}

void TransferSettings::save() const
{
    QSettings settings;
    save(settings);
}

void TransferSettings::save(QSettings &settings) const
{
    settings.setValue("listing/pageSize", pageSize);
    settings.setValue("listing/cacheTtlSeconds", cacheTtlSeconds);
    settings.setValue("transfers/maxConcurrentBatches", maxConcurrentBatches);
    settings.setValue("transfers/progressIntervalMs", progressIntervalMs);
    settings.setValue("transfers/progressStepPercent", progressStepPercent);
    settings.setValue("sharing/presignTtlSeconds", presignTtlSeconds);
}

void TransferSettings::applyTo(TransferExecutor *executor, ListingCache *cache,
                               StorageService *service) const
{
    if (executor) {
        executor->setMaxConcurrentBatches(maxConcurrentBatches);
        executor->setProgressThrottle(progressStepPercent, progressIntervalMs);
    }
    if (cache) {
        cache->setCacheTtl(cacheTtlSeconds);
    }
    if (service) {
        service->setDefaultPresignTtl(presignTtlSeconds);
    }
}
