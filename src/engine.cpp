#include "engine.hpp"

namespace huddle {

const char* ToString(CommandKind kind) {
    switch (kind) {
        case CommandKind::AddPeer: return "add-peer";
        case CommandKind::RemovePeer: return "remove-peer";
        case CommandKind::MediaEvent: return "media-event";
        case CommandKind::Shutdown: return "shutdown";
    }
    return "unknown";
}

const char* ToString(EventKind kind) {
    switch (kind) {
        case EventKind::PeerReady: return "peer-ready";
        case EventKind::MediaEvent: return "media-event";
        case EventKind::PeerFailed: return "peer-failed";
        case EventKind::ShutdownComplete: return "shutdown-complete";
        case EventKind::Crashed: return "crashed";
    }
    return "unknown";
}

} // namespace huddle
