#include "router.hpp"

#include "endpoint.hpp"
#include "loop.hpp"
#include "websocket_channel.hpp"

#include <future>
#include <iostream>

namespace huddle {

Router::Router(ServerConfig config, RoomRegistry& registry)
    : Config_(std::move(config))
    , Registry_(registry)
    , Loop_(std::make_shared<Loop>())
{ }

Router::~Router() {
    Stop();
}

void Router::WsClientCallback(std::shared_ptr<rtc::WebSocket> ws) {
    auto id = IdGenerator_++;
    auto channel = std::make_shared<WebSocketChannel>(ws);
    auto endpoint = std::make_shared<PeerEndpoint>(channel, Registry_);

    ws->onOpen([id, weakChannel = std::weak_ptr<WebSocketChannel>(channel)] {
        if (auto channel = weakChannel.lock()) {
            std::cout << "[Client " << id << "] WebSocket connected from " << channel->RemoteAddress() << std::endl;
        }
    });

    Loop_->EnqueueTask([this, id, endpoint] {
        Clients_.emplace(id, endpoint);
    });

    // Runs only while the loop does, which the destructor stops.
    endpoint->GetLifeline().Watch([this, loop = Loop_, id] {
        loop->EnqueueTask([this, id] {
            Clients_.erase(id);
            std::cout << "[Client " << id << "] WebSocket disconnected" << std::endl;
        });
    });

    endpoint->Start();
}

void Router::Start() {
    rtc::WebSocketServer::Configuration wsCfg;
    wsCfg.port = Config_.port;
    wsCfg.enableTls = false;
    wsCfg.bindAddress = Config_.bindAddress;

    StartLoopThread(Loop_);

    WsServer_ = std::make_shared<rtc::WebSocketServer>(wsCfg);
    WsServer_->onClient([this](std::shared_ptr<rtc::WebSocket> ws) {
        WsClientCallback(std::move(ws));
    });

    std::cout << "[Router] Listening on ws://" << Config_.bindAddress << ":" << WsServer_->port() << std::endl;
}

void Router::Stop() {
    if (!WsServer_) {
        return;
    }

    WsServer_->stop();
    WsServer_.reset();

    auto done = std::make_shared<std::promise<void>>();
    auto closed = done->get_future();
    bool queued = Loop_->EnqueueTask([this, done] {
        std::cout << "[Router] Closing " << Clients_.size() << " clients" << std::endl;
        for (auto& [id, endpoint] : Clients_) {
            endpoint->Close();
        }
        Clients_.clear();
        Loop_->Stop();
        done->set_value();
    });

    if (queued) {
        closed.wait();
    }
}

} // namespace huddle
