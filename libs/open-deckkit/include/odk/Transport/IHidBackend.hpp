#pragma once

#include <odk/Transport/IHidDevice.hpp>
#include <QList>
#include <QObject>
#include <memory>

namespace odk {

class IHidBackend : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~IHidBackend() override = default;

    virtual QList<HidDeviceInfo> enumerate() = 0;
    /// Returns nullptr on failure and fills error when given. Safe to call
    /// from a worker thread.
    virtual std::unique_ptr<IHidDevice> open(const HidDeviceInfo& info, QString* error = nullptr) = 0;

    virtual void startHotplug() = 0;
    virtual void stopHotplug() = 0;

signals:
    void deviceArrived(const odk::HidDeviceInfo& info);
    void deviceRemoved(const odk::HidDeviceInfo& info);
};

} // namespace odk
