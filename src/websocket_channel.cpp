#include "websocket_channel.hpp"

#include <iostream>
#include <variant>

namespace huddle {

WebSocketChannel::WebSocketChannel(std::shared_ptr<rtc::WebSocket> ws)
    : Ws_(std::move(ws))
{ }

void WebSocketChannel::Send(const std::string& message) {
    if (!Ws_->isOpen()) {
        return;
    }

    try {
        Ws_->send(message);
    } catch (const std::exception& e) {
        std::cerr << "[WebSocket " << RemoteAddress() << "] Send failed: " << e.what() << std::endl;
    }
}

void WebSocketChannel::Close() {
    Ws_->close();
}

void WebSocketChannel::OnMessage(MessageCallback callback) {
    Ws_->onMessage([callback = std::move(callback)](rtc::message_variant message) {
        auto text = std::get_if<std::string>(&message);
        if (!text) {
            return;
        }
        callback(std::move(*text));
    });
}

void WebSocketChannel::OnClosed(ClosedCallback callback) {
    // Errors are followed by a close notification.
    Ws_->onError([address = RemoteAddress()](std::string error) {
        std::cerr << "[WebSocket " << address << "] Error: " << error << std::endl;
    });
    Ws_->onClosed(std::move(callback));
}

std::string WebSocketChannel::RemoteAddress() const {
    auto address = Ws_->remoteAddress();
    return address ? *address : "unknown";
}

} // namespace huddle
