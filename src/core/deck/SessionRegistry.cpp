#include "core/deck/SessionRegistry.hpp"
#include "core/deck/DeviceSession.hpp"
#include <QMutexLocker>
#include <boost/log/trivial.hpp>

namespace odb {

SessionRegistry::SessionRegistry(QObject* parent)
    : QObject(parent)
{
}

bool SessionRegistry::insert(const QString& id, const Entry& entry)
{
    {
        QMutexLocker lock(&mutex_);
        if (entries_.contains(id))
            return false;
        entries_.insert(id, entry);
    }

    BOOST_LOG_TRIVIAL(debug) << "[Registry] Added " << id.toStdString();
    emit entryAdded(id);
    return true;
}

bool SessionRegistry::remove(const QString& id, const DeviceSession* owner)
{
    Entry removed;
    {
        QMutexLocker lock(&mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end())
            return false;
        if (owner && it->session.get() != owner)
            return false;
        removed = it.value();
        entries_.erase(it);
    }

    BOOST_LOG_TRIVIAL(debug) << "[Registry] Removed " << id.toStdString();
    emit entryRemoved(id);
    // `removed` may hold the last reference; it is released here, outside the lock
    return true;
}

bool SessionRegistry::contains(const QString& id) const
{
    QMutexLocker lock(&mutex_);
    return entries_.contains(id);
}

std::shared_ptr<DeviceSession> SessionRegistry::session(const QString& id) const
{
    QMutexLocker lock(&mutex_);
    auto it = entries_.constFind(id);
    return it == entries_.constEnd() ? nullptr : it->session;
}

bool SessionRegistry::cancel(const QString& id, CancelReason reason)
{
    CancellationToken token;
    std::shared_ptr<DeviceSession> session;
    {
        QMutexLocker lock(&mutex_);
        auto it = entries_.constFind(id);
        if (it == entries_.constEnd())
            return false;
        token = it->token;
        session = it->session;
    }

    if (session)
        return session->cancel(reason);
    return token.cancel(reason);
}

int SessionRegistry::cancelAll(CancelReason reason)
{
    QList<Entry> snapshot;
    {
        QMutexLocker lock(&mutex_);
        snapshot = entries_.values();
    }

    int cancelled = 0;
    for (auto entry : snapshot) {
        const bool first = entry.session ? entry.session->cancel(reason)
                                         : entry.token.cancel(reason);
        if (first)
            ++cancelled;
    }
    return cancelled;
}

QStringList SessionRegistry::ids() const
{
    QMutexLocker lock(&mutex_);
    return entries_.keys();
}

int SessionRegistry::size() const
{
    QMutexLocker lock(&mutex_);
    return entries_.size();
}

} // namespace odb
