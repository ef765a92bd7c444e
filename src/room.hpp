#pragma once

#include "fwd.hpp"
#include "engine.hpp"
#include "lifeline.hpp"
#include "loop.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <unordered_map>
#include <vector>

namespace huddle {

enum class RoomState {
    Starting,
    Active,
    Terminating,
    Terminated,
};

const char* ToString(RoomState state);

// Callbacks into whoever keeps the directory of rooms. All of them are
// invoked from the room's own thread.
struct RoomHooks {
    // A registration handed out by the directory reached the room.
    std::function<void()> onJoinDelivered;
    // Asked when the room runs empty; false keeps the room active. force is
    // set when the room is going down regardless.
    std::function<bool(bool force)> tryRetire;
    std::function<void(const Room&)> onTerminated;
};

// Coordinator of one room. Owns the peer set and the media engine, relays
// client events to the engine and engine events to the peers. Every public
// method only enqueues a message; state is touched by the room's thread alone.
class Room : public std::enable_shared_from_this<Room> {
public:
    struct Options {
        std::chrono::milliseconds shutdownTimeout{5000};
    };

    // Creates the engine and starts the mailbox thread. Throws if the engine
    // cannot be created.
    static std::shared_ptr<Room> Start(const RoomId& id, const EngineFactory& factory,
                                       Options options, RoomHooks hooks);

    Room(RoomId id, std::unique_ptr<MediaEngine> engine, Options options, RoomHooks hooks);

    Room(const Room&) = delete;
    Room& operator=(const Room&) = delete;

    // False if the room no longer processes messages.
    bool RegisterPeer(const PeerId& peerId, std::weak_ptr<PeerEndpoint> endpoint);
    void RelayClientEvent(const PeerId& peerId, Payload payload);
    void LeavePeer(const PeerId& peerId);

    // Detaches every peer and terminates.
    void Shutdown();

    const RoomId& Id() const {
        return Id_;
    }

    RoomState State() const {
        return State_.load();
    }

    // Blocks until the room thread answers. Empty once terminated.
    std::vector<PeerId> Peers();

    bool WaitTerminated(std::chrono::milliseconds timeout) const;

private:
    struct PeerHandle {
        std::weak_ptr<PeerEndpoint> endpoint;
        MonitorToken monitor;
    };

    void Post(Task&& task);

    void HandleRegisterPeer(const PeerId& peerId, const std::weak_ptr<PeerEndpoint>& endpoint);
    void HandleClientEvent(const PeerId& peerId, Payload&& payload);
    void HandleEngineEvent(EngineEvent&& event);
    void HandlePeerDown(const PeerId& peerId);
    void HandleShutdown();

    void DeliverTo(const PeerId& peerId, const Payload& payload);
    // Returns false if the peer was not registered.
    bool RemovePeer(const PeerId& peerId, const char* reason);
    void DetachPeer(const PeerId& peerId, const PeerHandle& handle, const std::string& reason);
    void DetachAll(const std::string& reason);
    bool SendToEngine(CommandKind kind, const PeerId& peerId, Payload data = {});

    void MaybeRetire();
    void BeginTermination();
    void Finish();

private:
    const RoomId Id_;
    const Options Options_;
    RoomHooks Hooks_;

    std::shared_ptr<Loop> Loop_;
    std::unique_ptr<MediaEngine> Engine_;
    std::atomic<RoomState> State_{RoomState::Starting};

    std::unordered_map<PeerId, PeerHandle> Participants_;

    std::promise<void> TerminatedPromise_;
    std::shared_future<void> Terminated_;
};

} // namespace huddle
