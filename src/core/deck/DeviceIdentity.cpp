#include "core/deck/DeviceIdentity.hpp"

namespace odb {

QString sanitizeIdentifier(const QString& raw, int maxLength)
{
    QString cleaned;
    cleaned.reserve(raw.size());
    for (const QChar c : raw) {
        const ushort u = c.unicode();
        if ((u >= '0' && u <= '9') || (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z'))
            cleaned.append(c);
    }

    if (cleaned.size() > maxLength)
        return cleaned.right(maxLength);
    return cleaned;
}

QString normalisedSerial(const QString& serial)
{
    const QString trimmed = serial.trimmed();
    if (trimmed.isEmpty())
        return {};
    return sanitizeIdentifier(trimmed, SERIAL_MAX_LENGTH);
}

QString fallbackSerial(const odk::HidDeviceInfo& info, const odk::DeviceVariant& variant)
{
    QString suffix = QStringLiteral("%1%2")
                         .arg(info.vendorId, 4, 16, QLatin1Char('0'))
                         .arg(info.productId, 4, 16, QLatin1Char('0'))
                         .toUpper();
    suffix += sanitizeIdentifier(variant.tag, FALLBACK_TAG_LENGTH);
    suffix += sanitizeIdentifier(info.path, FALLBACK_PATH_LENGTH);
    return suffix;
}

QString deviceIdFor(const QString& deviceNamespace, const odk::HidDeviceInfo& info,
                    const odk::DeviceVariant& variant)
{
    QString suffix = normalisedSerial(info.serialNumber);
    if (suffix.isEmpty())
        suffix = fallbackSerial(info, variant);
    return deviceNamespace + QLatin1Char('-') + suffix;
}

} // namespace odb
