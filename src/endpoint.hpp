#pragma once

#include "fwd.hpp"
#include "lifeline.hpp"
#include "loop.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace huddle {

struct SessionContext {
    RoomId roomId;
    std::weak_ptr<Room> room;
    PeerId peerId;
};

struct JoinError {
    std::string reason;
};

using JoinResult = std::variant<SessionContext, JoinError>;

// Bridges one client channel to the room it joined. Channel input and room
// output are both queued on the endpoint's own mailbox, so neither side ever
// waits on the other.
class PeerEndpoint : public std::enable_shared_from_this<PeerEndpoint> {
public:
    PeerEndpoint(std::shared_ptr<Channel> channel, RoomRegistry& registry);

    PeerEndpoint(const PeerEndpoint&) = delete;
    PeerEndpoint& operator=(const PeerEndpoint&) = delete;

    // Subscribes to the channel and starts the mailbox thread.
    void Start();

    // Called from the endpoint's thread.
    JoinResult OnJoinRequest(const std::string& roomTarget);
    void OnInboundClientEvent(const SessionContext& session, Payload payload);

    // Called by the room; never blocks.
    void OnRoomEvent(Payload payload);
    void OnRoomDetached(const PeerId& peerId, const RoomId& roomId, std::string reason);

    Lifeline& GetLifeline() {
        return Lifeline_;
    }

    // Closes the channel; termination follows from its close notification.
    void Close();

    // Watchers learn about it through the lifeline.
    void Terminate();

private:
    void Post(Task&& task);

    void HandleChannelMessage(const std::string& message);

private:
    std::shared_ptr<Channel> Channel_;
    RoomRegistry& Registry_;

    std::shared_ptr<Loop> Loop_;
    Lifeline Lifeline_;

    std::optional<SessionContext> Session_;
};

} // namespace huddle
