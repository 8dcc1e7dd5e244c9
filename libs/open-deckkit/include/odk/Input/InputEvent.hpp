#pragma once

#include <QMetaType>
#include <cstdint>

namespace odk {

enum class SwipeDirection {
    Left,
    Right
};

/// Semantic input produced by InputDecoder. Only the fields relevant to
/// `type` carry meaning.
struct InputEvent {
    enum class Type {
        ButtonPress,
        EncoderTwist,
        EncoderPress,
        TouchTap,
        TouchSwipe,
        Unknown
    };

    Type type = Type::Unknown;
    int index = 0;          // button, encoder or touch-zone index
    bool pressed = false;   // ButtonPress, EncoderPress
    int delta = 0;          // EncoderTwist: +1 clockwise, -1 counter-clockwise
    SwipeDirection direction = SwipeDirection::Left;
    uint8_t rawCode = 0;
    uint8_t rawState = 0;

    static InputEvent buttonPress(int index, bool pressed) {
        InputEvent e;
        e.type = Type::ButtonPress;
        e.index = index;
        e.pressed = pressed;
        return e;
    }

    static InputEvent encoderTwist(int index, int delta) {
        InputEvent e;
        e.type = Type::EncoderTwist;
        e.index = index;
        e.delta = delta;
        return e;
    }

    static InputEvent encoderPress(int index, bool pressed) {
        InputEvent e;
        e.type = Type::EncoderPress;
        e.index = index;
        e.pressed = pressed;
        return e;
    }

    static InputEvent touchTap(int zone) {
        InputEvent e;
        e.type = Type::TouchTap;
        e.index = zone;
        return e;
    }

    static InputEvent touchSwipe(SwipeDirection direction) {
        InputEvent e;
        e.type = Type::TouchSwipe;
        e.direction = direction;
        return e;
    }

    static InputEvent unknown(uint8_t rawCode, uint8_t rawState) {
        InputEvent e;
        e.type = Type::Unknown;
        e.rawCode = rawCode;
        e.rawState = rawState;
        return e;
    }

    bool isUnknown() const { return type == Type::Unknown; }

    bool operator==(const InputEvent& other) const {
        if (type != other.type) return false;
        switch (type) {
        case Type::ButtonPress:
        case Type::EncoderPress:
            return index == other.index && pressed == other.pressed;
        case Type::EncoderTwist:
            return index == other.index && delta == other.delta;
        case Type::TouchTap:
            return index == other.index;
        case Type::TouchSwipe:
            return direction == other.direction;
        case Type::Unknown:
            return rawCode == other.rawCode && rawState == other.rawState;
        }
        return false;
    }
    bool operator!=(const InputEvent& other) const { return !(*this == other); }
};

} // namespace odk

Q_DECLARE_METATYPE(odk::InputEvent)
