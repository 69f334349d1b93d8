#ifndef TRANSFERSETTINGS_H
#define TRANSFERSETTINGS_H

class ListingCache;
class QSettings;
class StorageService;
class TransferExecutor;

/**
 * @brief Tunables for listing, transfers and sharing, persisted in QSettings.
 *
 * Values read from settings are clamped to their valid range; a clamped
 * value is reported with qWarning().
 */
struct TransferSettings {
    int pageSize = 500;               ///< listing/pageSize, 1..1000
    int cacheTtlSeconds = 30;         ///< listing/cacheTtlSeconds, 0..86400 (0 = never stale)
    int maxConcurrentBatches = 0;     ///< transfers/maxConcurrentBatches, 0..64 (0 = unlimited)
    int progressIntervalMs = 100;     ///< transfers/progressIntervalMs, 0..10000
    int progressStepPercent = 1;      ///< transfers/progressStepPercent, 1..100
    int presignTtlSeconds = 3600;     ///< sharing/presignTtlSeconds, 1..604800

    /// @brief Loads from the application's default QSettings.
    [[nodiscard]] static TransferSettings load();
    [[nodiscard]] static TransferSettings load(const QSettings &settings);

    void save() const;
    void save(QSettings &settings) const;

    /**
     * @brief Pushes the values into the running components. Null pointers are skipped.
     */
    void applyTo(TransferExecutor *executor, ListingCache *cache, StorageService *service) const;
};

#endif // TRANSFERSETTINGS_H
