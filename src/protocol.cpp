#include "protocol.hpp"

namespace huddle::protocol {

namespace {

using json = nlohmann::json;

} // namespace

ClientMessage ParseClientMessage(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ProtocolError(std::string("invalid JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw ProtocolError("message must be a JSON object");
    }

    auto typeIt = j.find("type");
    if (typeIt == j.end() || !typeIt->is_string()) {
        throw ProtocolError("message missing type");
    }

    const std::string type = *typeIt;

    if (type == "join") {
        auto topicIt = j.find("topic");
        if (topicIt == j.end() || !topicIt->is_string()) {
            throw ProtocolError("join missing topic");
        }
        return Join{topicIt->get<std::string>()};
    }
    if (type == "mediaEvent") {
        auto dataIt = j.find("data");
        if (dataIt == j.end()) {
            throw ProtocolError("mediaEvent missing data");
        }
        return MediaEvent{std::move(*dataIt)};
    }
    if (type == "leave") {
        return Leave{};
    }
    if (type == "ping") {
        return Ping{};
    }

    throw ProtocolError("unknown message type: " + type);
}

std::string MakeJoined(const RoomId& roomId, const PeerId& peerId) {
    return json({{"type", "joined"}, {"room", roomId}, {"peerId", peerId}}).dump();
}

std::string MakeJoinError(const std::string& reason) {
    return json({{"type", "joinError"}, {"reason", reason}}).dump();
}

std::string MakeMediaEvent(const Payload& data) {
    return json({{"type", "mediaEvent"}, {"data", data}}).dump();
}

std::string MakeLeft(const RoomId& roomId) {
    return json({{"type", "left"}, {"room", roomId}}).dump();
}

std::string MakeRoomClosed(const RoomId& roomId, const std::string& reason) {
    return json({{"type", "roomClosed"}, {"room", roomId}, {"reason", reason}}).dump();
}

std::string MakePong() {
    return json({{"type", "pong"}}).dump();
}

std::string MakeError(const std::string& reason) {
    return json({{"type", "error"}, {"reason", reason}}).dump();
}

} // namespace huddle::protocol
