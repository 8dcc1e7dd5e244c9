#pragma once
#include <cstdint>

namespace odk {

constexpr uint16_t VERSION_MAJOR = 0;
constexpr uint16_t VERSION_MINOR = 3;
constexpr uint16_t VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "0.3.0";

// Vendor protocol generations understood by PacketFramer.
constexpr int PROTOCOL_V1 = 1;
constexpr int PROTOCOL_V2 = 2;
constexpr int PROTOCOL_V3 = 3;

} // namespace odk
