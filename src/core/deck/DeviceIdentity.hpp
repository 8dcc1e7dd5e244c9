#pragma once

#include <odk/Catalog/DeviceVariant.hpp>
#include <odk/Transport/HidDeviceInfo.hpp>
#include <QString>

namespace odb {

constexpr int SERIAL_MAX_LENGTH = 32;
constexpr int FALLBACK_TAG_LENGTH = 8;
constexpr int FALLBACK_PATH_LENGTH = 16;

/// A discovered HID interface that resolved to a supported variant.
struct CandidateDevice {
    QString id;
    odk::HidDeviceInfo info;
    odk::DeviceVariant variant;
};

/// Keeps ASCII alphanumerics only, then the last maxLength of them.
/// Empty when nothing usable remains.
QString sanitizeIdentifier(const QString& raw, int maxLength);

/// Trimmed and sanitised USB serial, empty when absent or unusable.
QString normalisedSerial(const QString& serial);

/// VVVVPPPP + variant tag + HID path fragment, for devices without a serial.
QString fallbackSerial(const odk::HidDeviceInfo& info, const odk::DeviceVariant& variant);

/// "<namespace>-<serial or fallback>"
QString deviceIdFor(const QString& deviceNamespace, const odk::HidDeviceInfo& info,
                    const odk::DeviceVariant& variant);

} // namespace odb
