#pragma once

#include <QMetaType>
#include <QString>
#include <cstdint>

namespace odk {

struct HidDeviceInfo {
    QString path;
    uint16_t vendorId = 0;
    uint16_t productId = 0;
    uint16_t usagePage = 0;
    uint16_t usage = 0;
    QString serialNumber;
    QString product;
};

enum class HidIoStatus {
    Ok,
    Timeout,
    Disconnected,
    IoError
};

inline const char* hidIoStatusName(HidIoStatus status) {
    switch (status) {
    case HidIoStatus::Ok: return "Ok";
    case HidIoStatus::Timeout: return "Timeout";
    case HidIoStatus::Disconnected: return "Disconnected";
    case HidIoStatus::IoError: return "IoError";
    }
    return "?";
}

} // namespace odk

Q_DECLARE_METATYPE(odk::HidDeviceInfo)
