#pragma once

#include "fwd.hpp"

#include <stdexcept>
#include <string_view>

namespace huddle {

// Join targets look like "room:<id>".
constexpr std::string_view RoomTargetPrefix = "room:";

class RoomTargetError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Throws RoomTargetError on a missing prefix or an empty or malformed id.
RoomId ParseRoomTarget(std::string_view target);

// 128 random bits as 32 lowercase hex characters.
PeerId GeneratePeerId();

// First eight characters, for log lines.
std::string ShortId(const PeerId& peerId);

} // namespace huddle
