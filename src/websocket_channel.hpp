#pragma once

#include "channel.hpp"

#include <rtc/rtc.hpp>

#include <memory>

namespace huddle {

class WebSocketChannel : public Channel {
public:
    explicit WebSocketChannel(std::shared_ptr<rtc::WebSocket> ws);

    void Send(const std::string& message) override;
    void Close() override;

    void OnMessage(MessageCallback callback) override;
    void OnClosed(ClosedCallback callback) override;

    std::string RemoteAddress() const;

private:
    std::shared_ptr<rtc::WebSocket> Ws_;
};

} // namespace huddle
