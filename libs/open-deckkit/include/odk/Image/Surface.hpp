#pragma once

#include <QHash>
#include <QMetaType>

namespace odk {

/// A drawable area on the device: one LCD button, one touch-strip zone, or
/// the whole device (clear-all only).
struct Surface {
    enum class Kind {
        Button,
        TouchZone,
        All
    };

    Kind kind = Kind::Button;
    int index = 0;

    static Surface button(int index) { return {Kind::Button, index}; }
    static Surface touchZone(int index) { return {Kind::TouchZone, index}; }
    static Surface all() { return {Kind::All, 0}; }

    bool operator==(const Surface& other) const {
        return kind == other.kind && (kind == Kind::All || index == other.index);
    }
    bool operator!=(const Surface& other) const { return !(*this == other); }
};

inline size_t qHash(const Surface& s, size_t seed = 0) noexcept {
    return ::qHash(static_cast<int>(s.kind) * 1024 + s.index, seed);
}

} // namespace odk

Q_DECLARE_METATYPE(odk::Surface)
