#pragma once

#include "fwd.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>

namespace huddle {

enum class CommandKind {
    AddPeer,
    RemovePeer,
    MediaEvent,
    Shutdown,
};

enum class EventKind {
    PeerReady,
    MediaEvent,
    PeerFailed,
    ShutdownComplete,
    Crashed,
};

const char* ToString(CommandKind kind);
const char* ToString(EventKind kind);

struct EngineCommand {
    CommandKind kind;
    PeerId peer;
    Payload data;
};

struct EngineEvent {
    EventKind kind;
    std::optional<PeerId> target;  // nullopt broadcasts to the whole room
    Payload data;
};

class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Command/event surface of a media-relay engine. Commands are one-way; the
// engine reports outcomes through events. Events about one peer arrive in the
// order the engine emitted them.
class MediaEngine {
public:
    using EventCallback = std::function<void(EngineEvent&&)>;

    virtual ~MediaEngine() = default;

    // Single consumer; set once before the first command.
    virtual void OnEvent(EventCallback callback) = 0;

    // Throws EngineError when the command is rejected.
    virtual void Command(EngineCommand&& command) = 0;
};

// Throws on failure.
using EngineFactory = std::function<std::unique_ptr<MediaEngine>(const RoomId& roomId)>;

} // namespace huddle
