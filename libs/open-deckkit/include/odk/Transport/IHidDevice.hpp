#pragma once

#include <odk/Transport/HidDeviceInfo.hpp>
#include <QByteArray>

namespace odk {

/// An open HID handle. Not thread safe: callers serialise access (one strand
/// per device). Destroying the object releases the handle.
class IHidDevice {
public:
    virtual ~IHidDevice() = default;

    /// Reads one input report into buffer. timeoutMs == 0 polls, < 0 blocks.
    virtual HidIoStatus read(QByteArray& buffer, int timeoutMs) = 0;
    virtual bool write(const QByteArray& report) = 0;
    virtual QString lastError() const = 0;
};

} // namespace odk
