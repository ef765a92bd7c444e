#pragma once

#include "fwd.hpp"

#include <stdexcept>
#include <string>
#include <variant>

// JSON signaling messages exchanged with browser clients.
namespace huddle::protocol {

struct Join {
    std::string topic;
};

struct MediaEvent {
    Payload data;
};

struct Leave {};

struct Ping {};

using ClientMessage = std::variant<Join, MediaEvent, Leave, Ping>;

class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Throws ProtocolError on malformed JSON, a missing field or an unknown type.
ClientMessage ParseClientMessage(const std::string& text);

std::string MakeJoined(const RoomId& roomId, const PeerId& peerId);
std::string MakeJoinError(const std::string& reason);
std::string MakeMediaEvent(const Payload& data);
std::string MakeLeft(const RoomId& roomId);
std::string MakeRoomClosed(const RoomId& roomId, const std::string& reason);
std::string MakePong();
std::string MakeError(const std::string& reason);

} // namespace huddle::protocol
