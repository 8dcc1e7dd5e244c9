#pragma once

#include <odk/Catalog/DeviceVariant.hpp>
#include <odk/Input/InputEvent.hpp>
#include <QString>

namespace odk {

// Maps raw (code, state) pairs from the firmware onto semantic events using
// the variant's code table. Stateless; safe to call from any thread.
// Codes the variant doesn't declare come back as InputEvent::Type::Unknown.
class InputDecoder {
public:
    static InputEvent decode(const DeviceVariant& variant, uint8_t rawCode, uint8_t rawState);

    /// Human readable form for logs, e.g. "ButtonPress(7, down)".
    static QString describe(const InputEvent& event);
};

} // namespace odk
