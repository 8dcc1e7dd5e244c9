#pragma once

#include "core/deck/CancellationToken.hpp"
#include <QHash>
#include <QMutex>
#include <QObject>
#include <QStringList>
#include <memory>

namespace odb {

class DeviceSession;

// Identity -> live session. At most one entry per identity; all operations
// are atomic with respect to each other and callable from any thread.
class SessionRegistry : public QObject {
    Q_OBJECT

public:
    struct Entry {
        CancellationToken token;
        std::shared_ptr<DeviceSession> session;
    };

    explicit SessionRegistry(QObject* parent = nullptr);

    /// False (and no change) if the identity is already present.
    bool insert(const QString& id, const Entry& entry);

    /// Removes the entry. With an owner, only removes it if it still belongs
    /// to that session, so a stale session cannot evict its successor.
    bool remove(const QString& id, const DeviceSession* owner = nullptr);

    bool contains(const QString& id) const;
    std::shared_ptr<DeviceSession> session(const QString& id) const;

    /// Requests cancellation; the entry stays until its session tears down.
    bool cancel(const QString& id, CancelReason reason);
    int cancelAll(CancelReason reason);

    QStringList ids() const;
    int size() const;
    bool isEmpty() const { return size() == 0; }

signals:
    void entryAdded(const QString& id);
    void entryRemoved(const QString& id);

private:
    mutable QMutex mutex_;
    QHash<QString, Entry> entries_;
};

} // namespace odb
