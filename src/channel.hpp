#pragma once

#include <functional>
#include <string>

namespace huddle {

// Duplex text message connection to one client.
class Channel {
public:
    using MessageCallback = std::function<void(std::string message)>;
    using ClosedCallback = std::function<void()>;

    virtual ~Channel() = default;

    // Non-blocking; may be called after the channel closed.
    virtual void Send(const std::string& message) = 0;
    virtual void Close() = 0;

    virtual void OnMessage(MessageCallback callback) = 0;
    virtual void OnClosed(ClosedCallback callback) = 0;
};

} // namespace huddle
