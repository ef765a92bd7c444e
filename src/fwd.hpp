#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace huddle {

using RoomId = std::string;
using PeerId = std::string;

// Opaque engine-specific data, forwarded verbatim.
using Payload = nlohmann::json;

class Loop;
class Lifeline;
class Channel;
class MediaEngine;
class PeerEndpoint;
class Room;
class RoomRegistry;
class Router;

} // namespace huddle
