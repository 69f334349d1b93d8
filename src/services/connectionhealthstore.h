#ifndef CONNECTIONHEALTHSTORE_H
#define CONNECTIONHEALTHSTORE_H

#include <QHash>
#include <QObject>
#include <QString>
#include <QStringList>

enum class ConnectionHealth {
    Unknown,
    Checking,
    Healthy,
    Unhealthy
};

/// @brief Convert ConnectionHealth to string for debugging
[[nodiscard]] inline const char* connectionHealthToString(ConnectionHealth health) {
    switch (health) {
        case ConnectionHealth::Unknown: return "unknown";
        case ConnectionHealth::Checking: return "checking";
        case ConnectionHealth::Healthy: return "healthy";
        case ConnectionHealth::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

/**
 * @brief Last known health of each configured connection.
 *
 * Owned by the application and handed to whoever reports or displays
 * health. Listeners connect to healthChanged() with a context object, so
 * they stop receiving updates when they are destroyed.
 */
class ConnectionHealthStore : public QObject
{
    Q_OBJECT

public:
    explicit ConnectionHealthStore(QObject *parent = nullptr);
    ~ConnectionHealthStore() override;

    [[nodiscard]] ConnectionHealth health(const QString &connectionId) const;

    /**
     * @brief Records the health of a connection.
     *
     * healthChanged() is only emitted when the value actually changes.
     */
    void setHealth(const QString &connectionId, ConnectionHealth health);

    void forget(const QString &connectionId);
    void clear();

    [[nodiscard]] QStringList knownConnections() const;

signals:
    void healthChanged(const QString &connectionId, ConnectionHealth health);

private:
    QHash<QString, ConnectionHealth> health_;
};

#endif // CONNECTIONHEALTHSTORE_H
