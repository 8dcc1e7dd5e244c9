#pragma once

#include <QString>
#include <cstdint>
#include <vector>

namespace odk {

enum class DeviceKind {
    AKP03,
    AKP03E,
    AKP03R,
    N3EN,
    AKP05
};

enum class ImageEncoding {
    Jpeg,
    Bmp
};

enum class ImageRotation {
    Rot0,
    Rot90,
    Rot180,
    Rot270
};

enum class ImageMirroring {
    None,
    Horizontal,
    Vertical,
    Both
};

struct ImageSpec {
    int width = 0;
    int height = 0;
    ImageEncoding encoding = ImageEncoding::Jpeg;
    ImageRotation rotation = ImageRotation::Rot0;
    ImageMirroring mirroring = ImageMirroring::None;

    bool isValid() const { return width > 0 && height > 0; }
};

struct EncoderCodes {
    uint8_t counterClockwise = 0;
    uint8_t clockwise = 0;
    uint8_t press = 0;
};

// Raw input codes as sent by the firmware. Positions in buttons/touchZones
// are the semantic indices (buttons row-major over the grid).
struct InputCodeTable {
    std::vector<uint8_t> buttons;
    std::vector<EncoderCodes> encoders;
    std::vector<uint8_t> touchZones;
    int swipeLeft = -1;   // -1 = variant has no swipe gestures
    int swipeRight = -1;
};

struct DeviceVariant {
    DeviceKind kind = DeviceKind::AKP03;
    QString name;       // reported to the host, USB product strings are unreliable
    QString tag;        // short identifier used in fallback identities

    // Identifying attributes
    uint16_t vendorId = 0;
    uint16_t productId = 0;
    uint16_t usagePage = 0;
    uint16_t usage = 0;

    // Geometry
    int rows = 0;
    int columns = 0;
    int lcdButtonCount = 0;   // buttons that carry a display
    int encoderCount = 0;
    int touchZoneCount = 0;

    ImageSpec buttonImage;
    ImageSpec touchZoneImage;

    // Protocol
    int protocolVersion = 1;
    int packetSize = 512;
    bool reportsBothStates = false;  // false: firmware sends press reports only
    int hostDeviceType = 0;

    InputCodeTable codes;

    int buttonCount() const { return rows * columns; }
};

} // namespace odk
