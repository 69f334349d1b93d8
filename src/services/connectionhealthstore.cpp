#include "connectionhealthstore.h"
#include "utils/logging.h"

#include <QStringList>

ConnectionHealthStore::ConnectionHealthStore(QObject *parent)
    : QObject(parent)
{
}

ConnectionHealthStore::~ConnectionHealthStore() = default;

ConnectionHealth ConnectionHealthStore::health(const QString &connectionId) const
{
    return health_.value(connectionId, ConnectionHealth::Unknown);
}

void ConnectionHealthStore::setHealth(const QString &connectionId, ConnectionHealth health)
{
    if (this->health(connectionId) == health) {
        return;
    }

    health_.insert(connectionId, health);
    LOG_VERBOSE() << "ConnectionHealthStore:" << connectionId << "is now"
                  << connectionHealthToString(health);
    emit healthChanged(connectionId, health);
}

void ConnectionHealthStore::forget(const QString &connectionId)
{
    const ConnectionHealth previous = health(connectionId);
    health_.remove(connectionId);
    if (previous != ConnectionHealth::Unknown) {
        emit healthChanged(connectionId, ConnectionHealth::Unknown);
    }
}

void ConnectionHealthStore::clear()
{
    const QHash<QString, ConnectionHealth> previous = health_;
    health_.clear();
    for (auto it = previous.constBegin(); it != previous.constEnd(); ++it) {
        if (it.value() != ConnectionHealth::Unknown) {
            emit healthChanged(it.key(), ConnectionHealth::Unknown);
        }
    }
}

QStringList ConnectionHealthStore::knownConnections() const
{
    return health_.keys();
}
