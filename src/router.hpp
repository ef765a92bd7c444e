#pragma once

#include "fwd.hpp"
#include "config.hpp"

#include <rtc/rtc.hpp>

#include <atomic>
#include <memory>
#include <unordered_map>

namespace huddle {

using ClientId = uint64_t;

// Accepts signaling WebSockets and gives each one a PeerEndpoint.
class Router {
public:
    Router(ServerConfig config, RoomRegistry& registry);
    ~Router();

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    void Start();

    // Stops accepting clients and closes the connected ones.
    void Stop();

private:
    void WsClientCallback(std::shared_ptr<rtc::WebSocket> ws);

private:
    const ServerConfig Config_;
    RoomRegistry& Registry_;

    std::atomic_uint64_t IdGenerator_{1};
    std::unordered_map<ClientId, std::shared_ptr<PeerEndpoint>> Clients_;

    std::shared_ptr<Loop> Loop_;
    std::shared_ptr<rtc::WebSocketServer> WsServer_;
};

} // namespace huddle
