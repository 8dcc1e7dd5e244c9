#pragma once

#include <odk/Catalog/DeviceVariant.hpp>
#include <odk/Image/Surface.hpp>
#include <QByteArray>
#include <QList>
#include <optional>

namespace odk {

constexpr int INPUT_REPORT_MIN_SIZE = 11;
constexpr int INPUT_CODE_OFFSET = 9;
constexpr int INPUT_STATE_OFFSET = 10;
constexpr uint8_t CLEAR_ALL_KEY = 0xFF;

struct RawInput {
    uint8_t code = 0;
    uint8_t state = 0;
};

/// Builds the vendor command packets ("CRT" family) understood by the
/// firmware. Every packet is HID report id 0 followed by a command padded to
/// the variant's packet size, so each QByteArray is exactly packetSize + 1 bytes.
class PacketFramer {
public:
    explicit PacketFramer(const DeviceVariant& variant);

    QByteArray wake() const;
    QByteArray brightness(int percent) const;
    QByteArray clear(uint8_t key) const;   // CLEAR_ALL_KEY clears every surface
    QByteArray flush() const;
    QByteArray sleep() const;

    /// Header packet followed by the payload split into packet-sized chunks.
    QList<QByteArray> imageWrite(uint8_t wireKey, const QByteArray& payload) const;

    /// Device-side key number for a surface, nullopt for Surface::Kind::All.
    std::optional<uint8_t> wireKey(const Surface& surface) const;

    /// Extracts (code, state) from an input report ("ACK\0\0OK\0\0" + code +
    /// state). Short reports are rejected.
    static std::optional<RawInput> parseInputReport(const QByteArray& report);

    int packetSize() const { return packetSize_; }
    int reportSize() const { return packetSize_ + 1; }

private:
    QByteArray command(const QByteArray& body) const;
    QByteArray pad(QByteArray packet) const;

    int packetSize_;
    int protocolVersion_;
    int buttonCount_;
};

} // namespace odk
