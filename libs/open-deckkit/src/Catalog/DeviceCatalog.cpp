#include <odk/Catalog/DeviceCatalog.hpp>
#include <odk/Version.hpp>

#include <QDebug>
#include <stdexcept>

namespace odk {

namespace {

InputCodeTable akp03Codes() {
    InputCodeTable codes;
    // Six LCD keys first, then the three plain keys below them
    codes.buttons = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x25, 0x30, 0x31};
    codes.encoders = {
        {0x90, 0x91, 0x33},
        {0x50, 0x51, 0x35},
        {0x60, 0x61, 0x34},
    };
    return codes;
}

// AKP05 codes are placeholders until verified against real hardware.
InputCodeTable akp05Codes() {
    InputCodeTable codes;
    codes.buttons = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09};
    codes.encoders = {
        {0x90, 0x91, 0x33},
        {0x50, 0x51, 0x35},
        {0x60, 0x61, 0x34},
        {0x70, 0x71, 0x36},
    };
    codes.touchZones = {0x40, 0x41, 0x42, 0x43};
    codes.swipeLeft = 0x38;
    codes.swipeRight = 0x39;
    return codes;
}

DeviceVariant akp03Family(DeviceKind kind, const char* name, const char* tag,
                          uint16_t vid, uint16_t pid, ImageRotation rotation,
                          int protocolVersion, bool bothStates) {
    DeviceVariant v;
    v.kind = kind;
    v.name = QString::fromLatin1(name);
    v.tag = QString::fromLatin1(tag);
    v.vendorId = vid;
    v.productId = pid;
    v.usagePage = DECK_USAGE_PAGE;
    v.usage = DECK_USAGE;
    v.rows = 3;
    v.columns = 3;
    v.lcdButtonCount = 6;
    v.encoderCount = 3;
    v.touchZoneCount = 0;
    v.buttonImage = {60, 60, ImageEncoding::Jpeg, rotation, ImageMirroring::None};
    v.protocolVersion = protocolVersion;
    v.packetSize = 512;
    v.reportsBothStates = bothStates;
    v.codes = akp03Codes();
    return v;
}

} // namespace

DeviceCatalog::DeviceCatalog()
    : DeviceCatalog(builtinVariants())
{
}

DeviceCatalog::DeviceCatalog(QList<DeviceVariant> variants)
    : variants_(std::move(variants))
{
    validate();
}

QList<DeviceVariant> DeviceCatalog::builtinVariants() {
    QList<DeviceVariant> list;

    list.append(akp03Family(DeviceKind::AKP03, "Ajazz AKP03", "AKP03",
                            AJAZZ_VID, AKP03_PID, ImageRotation::Rot90, PROTOCOL_V1, false));
    // Not sure whether the E model is revision 1 or 2, mapped as revision 1
    list.append(akp03Family(DeviceKind::AKP03E, "Ajazz AKP03E", "AKP03E",
                            AJAZZ_VID, AKP03E_PID, ImageRotation::Rot0, PROTOCOL_V1, false));
    list.append(akp03Family(DeviceKind::AKP03R, "Ajazz AKP03R", "AKP03R",
                            AJAZZ_VID, AKP03R_PID, ImageRotation::Rot0, PROTOCOL_V1, false));
    list.append(akp03Family(DeviceKind::N3EN, "Mirabox N3EN", "N3EN",
                            MIRABOX_VID, N3EN_PID, ImageRotation::Rot90, PROTOCOL_V2, true));

    DeviceVariant akp05;
    akp05.kind = DeviceKind::AKP05;
    akp05.name = QStringLiteral("Ajazz AKP05");
    akp05.tag = QStringLiteral("AKP05");
    akp05.vendorId = AJAZZ_VID;
    akp05.productId = AKP05_PID;
    akp05.usagePage = DECK_USAGE_PAGE;
    akp05.usage = DECK_USAGE;
    akp05.rows = 2;
    akp05.columns = 5;
    akp05.lcdButtonCount = 10;
    akp05.encoderCount = 4;
    akp05.touchZoneCount = 4;
    akp05.buttonImage = {112, 112, ImageEncoding::Jpeg, ImageRotation::Rot180, ImageMirroring::None};
    akp05.touchZoneImage = {176, 112, ImageEncoding::Jpeg, ImageRotation::Rot180, ImageMirroring::None};
    akp05.protocolVersion = PROTOCOL_V3;
    akp05.packetSize = 1024;
    akp05.reportsBothStates = true;
    akp05.codes = akp05Codes();
    list.append(akp05);

    return list;
}

void DeviceCatalog::validate() const {
    for (int i = 0; i < variants_.size(); ++i) {
        const auto& a = variants_[i];
        for (int j = i + 1; j < variants_.size(); ++j) {
            const auto& b = variants_[j];
            if (a.vendorId == b.vendorId && a.productId == b.productId
                && a.usagePage == b.usagePage && a.usage == b.usage) {
                qCritical() << "[DeviceCatalog] duplicate entry for"
                            << a.name << "and" << b.name;
                throw std::logic_error("duplicate device catalog entry: "
                                       + a.name.toStdString() + " / "
                                       + b.name.toStdString());
            }
        }
    }
}

const DeviceVariant* DeviceCatalog::lookup(uint16_t vendorId, uint16_t productId,
                                           uint16_t usagePage, uint16_t usage) const {
    for (const auto& v : variants_) {
        if (v.vendorId == vendorId && v.productId == productId
            && v.usagePage == usagePage && v.usage == usage)
            return &v;
    }
    return nullptr;
}

const DeviceVariant* DeviceCatalog::lookupByVidPid(uint16_t vendorId, uint16_t productId) const {
    for (const auto& v : variants_) {
        if (v.vendorId == vendorId && v.productId == productId)
            return &v;
    }
    return nullptr;
}

} // namespace odk
