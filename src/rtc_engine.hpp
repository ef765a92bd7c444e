#pragma once

#include "engine.hpp"

#include <memory>
#include <string>
#include <vector>

namespace huddle {

// Forwarding media engine on libdatachannel. Every peer gets a PeerConnection;
// tracks a peer publishes are forwarded to all other peers of the room.
//
// Media events from clients:
//   {"type": "offer" | "answer", "sdp": "..."}
//   {"type": "candidate", "candidate": "...", "sdpMid": "..."}
// The engine answers with the same shapes, targeted at the peer.
class RtcEngine : public MediaEngine {
public:
    struct Options {
        std::vector<std::string> iceServers;
    };

    RtcEngine(RoomId roomId, Options options);
    ~RtcEngine() override;

    void OnEvent(EventCallback callback) override;
    void Command(EngineCommand&& command) override;

    static EngineFactory Factory(Options options);

private:
    struct Impl;
    std::shared_ptr<Impl> Impl_;
};

} // namespace huddle
