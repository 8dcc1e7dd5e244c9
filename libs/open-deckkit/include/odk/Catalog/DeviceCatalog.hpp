#pragma once

#include <odk/Catalog/DeviceVariant.hpp>
#include <QList>

namespace odk {

constexpr uint16_t AJAZZ_VID = 0x0300;
constexpr uint16_t MIRABOX_VID = 0x6603;

constexpr uint16_t AKP03_PID = 0x1001;
constexpr uint16_t AKP03E_PID = 0x3002;
constexpr uint16_t AKP03R_PID = 0x1003;
constexpr uint16_t N3EN_PID = 0x1003;
constexpr uint16_t AKP05_PID = 0x3004;  // unverified, pending hardware access

// All supported devices expose their control interface on this usage.
constexpr uint16_t DECK_USAGE_PAGE = 0xFFA0;
constexpr uint16_t DECK_USAGE = 2;

/// Static table of supported hardware. Adding a device means adding a row
/// in DeviceCatalog.cpp; nothing else needs to change.
class DeviceCatalog {
public:
    /// Built-in table. Throws std::logic_error if two rows share the same
    /// identifying attributes.
    DeviceCatalog();

    /// Custom table (tests, future hardware). Same validation as above.
    explicit DeviceCatalog(QList<DeviceVariant> variants);

    /// Exact match on all four identifying attributes, nullptr if unknown.
    const DeviceVariant* lookup(uint16_t vendorId, uint16_t productId,
                                uint16_t usagePage, uint16_t usage) const;

    /// Match ignoring the HID usage (backends that don't report it).
    const DeviceVariant* lookupByVidPid(uint16_t vendorId, uint16_t productId) const;

    const QList<DeviceVariant>& variants() const { return variants_; }

    static QList<DeviceVariant> builtinVariants();

private:
    void validate() const;

    QList<DeviceVariant> variants_;
};

} // namespace odk
