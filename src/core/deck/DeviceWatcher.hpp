#pragma once

#include "core/deck/DeviceIdentity.hpp"
#include "core/deck/DeviceSession.hpp"
#include <odk/Catalog/DeviceCatalog.hpp>
#include <odk/Transport/IHidBackend.hpp>
#include <QObject>
#include <functional>
#include <optional>

namespace odb {

class SessionRegistry;

// Turns discovery and hotplug notifications into admitted sessions.
// Runs on the Qt main thread.
class DeviceWatcher : public QObject {
    Q_OBJECT

public:
    using SessionFactory = std::function<DeviceSession::Pointer(const CandidateDevice&,
                                                                const CancellationToken&)>;

    DeviceWatcher(odk::IHidBackend* backend,
                  const odk::DeviceCatalog* catalog,
                  SessionRegistry* registry,
                  const QString& deviceNamespace,
                  SessionFactory factory,
                  QObject* parent = nullptr);
    ~DeviceWatcher() override;

    /// Admits everything already plugged in, then follows hotplug.
    void start();
    void stop();
    bool isRunning() const { return running_; }

    std::optional<CandidateDevice> resolve(const odk::HidDeviceInfo& info) const;

    /// True if a new session was started for the device.
    bool admit(const odk::HidDeviceInfo& info);
    void remove(const odk::HidDeviceInfo& info);

signals:
    void deviceAdmitted(const QString& id);

private:
    odk::IHidBackend* backend_;
    const odk::DeviceCatalog* catalog_;
    SessionRegistry* registry_;
    QString deviceNamespace_;
    SessionFactory factory_;
    bool running_ = false;
};

} // namespace odb
