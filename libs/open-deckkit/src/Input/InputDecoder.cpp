#include <odk/Input/InputDecoder.hpp>

#include <algorithm>

namespace odk {

namespace {

int indexOf(const std::vector<uint8_t>& codes, uint8_t code) {
    for (size_t i = 0; i < codes.size(); ++i) {
        if (codes[i] == code)
            return static_cast<int>(i);
    }
    return -1;
}

} // namespace

InputEvent InputDecoder::decode(const DeviceVariant& variant, uint8_t rawCode, uint8_t rawState) {
    const auto& codes = variant.codes;
    const bool pressed = rawState != 0;

    int button = indexOf(codes.buttons, rawCode);
    if (button >= 0 && button < variant.buttonCount())
        return InputEvent::buttonPress(button, pressed);

    const int encoders = std::min(static_cast<int>(codes.encoders.size()), variant.encoderCount);
    for (int i = 0; i < encoders; ++i) {
        const auto& enc = codes.encoders[i];
        if (rawCode == enc.counterClockwise)
            return InputEvent::encoderTwist(i, -1);
        if (rawCode == enc.clockwise)
            return InputEvent::encoderTwist(i, 1);
        if (rawCode == enc.press)
            return InputEvent::encoderPress(i, pressed);
    }

    int zone = indexOf(codes.touchZones, rawCode);
    if (zone >= 0 && zone < variant.touchZoneCount)
        return InputEvent::touchTap(zone);

    if (codes.swipeLeft >= 0 && rawCode == codes.swipeLeft)
        return InputEvent::touchSwipe(SwipeDirection::Left);
    if (codes.swipeRight >= 0 && rawCode == codes.swipeRight)
        return InputEvent::touchSwipe(SwipeDirection::Right);

    return InputEvent::unknown(rawCode, rawState);
}

QString InputDecoder::describe(const InputEvent& event) {
    switch (event.type) {
    case InputEvent::Type::ButtonPress:
        return QStringLiteral("ButtonPress(%1, %2)")
            .arg(event.index).arg(event.pressed ? QStringLiteral("down") : QStringLiteral("up"));
    case InputEvent::Type::EncoderTwist:
        return QStringLiteral("EncoderTwist(%1, %2)").arg(event.index).arg(event.delta);
    case InputEvent::Type::EncoderPress:
        return QStringLiteral("EncoderPress(%1, %2)")
            .arg(event.index).arg(event.pressed ? QStringLiteral("down") : QStringLiteral("up"));
    case InputEvent::Type::TouchTap:
        return QStringLiteral("TouchTap(%1)").arg(event.index);
    case InputEvent::Type::TouchSwipe:
        return QStringLiteral("TouchSwipe(%1)")
            .arg(event.direction == SwipeDirection::Left ? QStringLiteral("left") : QStringLiteral("right"));
    case InputEvent::Type::Unknown:
        break;
    }
    return QStringLiteral("Unknown(0x%1, %2)")
        .arg(static_cast<uint>(event.rawCode), 2, 16, QLatin1Char('0'))
        .arg(static_cast<uint>(event.rawState));
}

} // namespace odk
