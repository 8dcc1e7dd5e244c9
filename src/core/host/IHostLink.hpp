#pragma once

#include "core/deck/SessionTypes.hpp"
#include <odk/Input/InputEvent.hpp>
#include <QObject>

namespace odb {

// Boundary to the host application. All calls happen on the Qt main thread.
class IHostLink : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~IHostLink() override = default;

    /// False means the host refused the device.
    virtual bool registerDevice(const DeviceRegistration& registration) = 0;
    virtual void forwardInput(const QString& deviceId, const odk::InputEvent& event) = 0;
    virtual void reportDisconnect(const QString& deviceId) = 0;

signals:
    void setImageRequested(const QString& deviceId, const odb::ImageSetRequest& request);
    void brightnessRequested(const QString& deviceId, int level);
    void hostDisconnected();
};

} // namespace odb
