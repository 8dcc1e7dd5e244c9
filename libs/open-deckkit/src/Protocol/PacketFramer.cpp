#include <odk/Protocol/PacketFramer.hpp>
#include <odk/Version.hpp>

#include <QtEndian>

namespace odk {

namespace {

const QByteArray COMMAND_PREFIX("CRT\0\0", 5);

} // namespace

PacketFramer::PacketFramer(const DeviceVariant& variant)
    : packetSize_(variant.packetSize)
    , protocolVersion_(variant.protocolVersion)
    , buttonCount_(variant.buttonCount())
{
}

QByteArray PacketFramer::pad(QByteArray packet) const {
    if (packet.size() < reportSize())
        packet.append(QByteArray(reportSize() - packet.size(), '\0'));
    return packet;
}

QByteArray PacketFramer::command(const QByteArray& body) const {
    QByteArray packet(1, '\0');  // report id
    packet.append(COMMAND_PREFIX);
    packet.append(body);
    return pad(packet);
}

QByteArray PacketFramer::wake() const {
    return command(QByteArrayLiteral("DIS"));
}

QByteArray PacketFramer::brightness(int percent) const {
    QByteArray body("LIG\0\0", 5);
    body.append(static_cast<char>(qBound(0, percent, 100)));
    return command(body);
}

QByteArray PacketFramer::clear(uint8_t key) const {
    QByteArray body("CLE\0\0\0", 6);
    body.append(static_cast<char>(key == CLEAR_ALL_KEY ? CLEAR_ALL_KEY : key + 1));
    return command(body);
}

QByteArray PacketFramer::flush() const {
    return command(QByteArrayLiteral("STP"));
}

QByteArray PacketFramer::sleep() const {
    return command(QByteArrayLiteral("HAN"));
}

QList<QByteArray> PacketFramer::imageWrite(uint8_t wireKey, const QByteArray& payload) const {
    QList<QByteArray> packets;

    QByteArray body("BAT\0\0", 5);
    const auto length = static_cast<uint32_t>(payload.size());
    if (protocolVersion_ >= PROTOCOL_V3) {
        char len[4];
        qToBigEndian<uint32_t>(length, len);
        body.append(len, 4);
    } else {
        char len[2];
        qToBigEndian<uint16_t>(static_cast<uint16_t>(length), len);
        body.append(len, 2);
    }
    body.append(static_cast<char>(wireKey + 1));
    packets.append(command(body));

    for (int offset = 0; offset < payload.size(); offset += packetSize_) {
        QByteArray chunk(1, '\0');
        chunk.append(payload.mid(offset, packetSize_));
        packets.append(pad(chunk));
    }

    return packets;
}

std::optional<uint8_t> PacketFramer::wireKey(const Surface& surface) const {
    switch (surface.kind) {
    case Surface::Kind::Button:
        return static_cast<uint8_t>(surface.index);
    case Surface::Kind::TouchZone:
        return static_cast<uint8_t>(buttonCount_ + surface.index);
    case Surface::Kind::All:
        break;
    }
    return std::nullopt;
}

std::optional<RawInput> PacketFramer::parseInputReport(const QByteArray& report) {
    if (report.size() < INPUT_REPORT_MIN_SIZE)
        return std::nullopt;

    RawInput input;
    input.code = static_cast<uint8_t>(report[INPUT_CODE_OFFSET]);
    input.state = static_cast<uint8_t>(report[INPUT_STATE_OFFSET]);

    return input;
}

} // namespace odk
