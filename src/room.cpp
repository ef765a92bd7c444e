#include "room.hpp"

#include "endpoint.hpp"
#include "ids.hpp"

#include <iostream>

namespace huddle {

const char* ToString(RoomState state) {
    switch (state) {
        case RoomState::Starting: return "starting";
        case RoomState::Active: return "active";
        case RoomState::Terminating: return "terminating";
        case RoomState::Terminated: return "terminated";
    }
    return "unknown";
}

std::shared_ptr<Room> Room::Start(const RoomId& id, const EngineFactory& factory,
                                  Options options, RoomHooks hooks)
{
    std::cout << "[Room " << id << "] Starting" << std::endl;

    auto engine = factory(id);
    if (!engine) {
        throw EngineError("engine factory returned no engine");
    }

    auto room = std::make_shared<Room>(id, std::move(engine), options, std::move(hooks));

    std::weak_ptr<Room> weakRoom = room;
    room->Engine_->OnEvent([weakRoom](EngineEvent&& event) {
        auto room = weakRoom.lock();
        if (!room) {
            return;
        }
        room->Post([room, event = std::move(event)]() mutable {
            room->HandleEngineEvent(std::move(event));
        });
    });

    room->State_ = RoomState::Active;
    StartLoopThread(room->Loop_);

    std::cout << "[Room " << id << "] Active" << std::endl;
    return room;
}

Room::Room(RoomId id, std::unique_ptr<MediaEngine> engine, Options options, RoomHooks hooks)
    : Id_(std::move(id))
    , Options_(options)
    , Hooks_(std::move(hooks))
    , Loop_(std::make_shared<Loop>())
    , Engine_(std::move(engine))
    , Terminated_(TerminatedPromise_.get_future().share())
{ }

bool Room::RegisterPeer(const PeerId& peerId, std::weak_ptr<PeerEndpoint> endpoint) {
    return Loop_->EnqueueTask([self = shared_from_this(), peerId, endpoint = std::move(endpoint)] {
        self->HandleRegisterPeer(peerId, endpoint);
    });
}

void Room::RelayClientEvent(const PeerId& peerId, Payload payload) {
    Post([self = shared_from_this(), peerId, payload = std::move(payload)]() mutable {
        self->HandleClientEvent(peerId, std::move(payload));
    });
}

void Room::LeavePeer(const PeerId& peerId) {
    Post([self = shared_from_this(), peerId] {
        if (self->RemovePeer(peerId, "left")) {
            self->MaybeRetire();
        }
    });
}

void Room::Shutdown() {
    Post([self = shared_from_this()] {
        self->HandleShutdown();
    });
}

std::vector<PeerId> Room::Peers() {
    auto promise = std::make_shared<std::promise<std::vector<PeerId>>>();
    auto future = promise->get_future();

    bool queued = Loop_->EnqueueTask([self = shared_from_this(), promise] {
        std::vector<PeerId> peers;
        peers.reserve(self->Participants_.size());
        for (auto& [id, handle] : self->Participants_) {
            peers.push_back(id);
        }
        promise->set_value(std::move(peers));
    });

    if (!queued) {
        return {};
    }
    // Queued tasks always run, the loop drains on close.
    return future.get();
}

bool Room::WaitTerminated(std::chrono::milliseconds timeout) const {
    return Terminated_.wait_for(timeout) == std::future_status::ready;
}

void Room::Post(Task&& task) {
    if (!Loop_->EnqueueTask(std::move(task))) {
        std::cout << "[Room " << Id_ << "] Dropping message, room is terminated" << std::endl;
    }
}

void Room::HandleRegisterPeer(const PeerId& peerId, const std::weak_ptr<PeerEndpoint>& endpoint) {
    if (Hooks_.onJoinDelivered) {
        Hooks_.onJoinDelivered();
    }

    auto target = endpoint.lock();

    if (State_ != RoomState::Active) {
        std::cout << "[Room " << Id_ << "] Rejecting peer " << ShortId(peerId)
                  << ", room is " << ToString(State_) << std::endl;
        if (target) {
            target->OnRoomDetached(peerId, Id_, "room is closing");
        }
        return;
    }

    if (Participants_.count(peerId)) {
        std::cerr << "[Room " << Id_ << "] Peer " << ShortId(peerId) << " is already registered" << std::endl;
        return;
    }

    if (!target) {
        std::cout << "[Room " << Id_ << "] Peer " << ShortId(peerId) << " went away before registration" << std::endl;
        MaybeRetire();
        return;
    }

    std::weak_ptr<Room> weakRoom = shared_from_this();
    auto monitor = target->GetLifeline().Watch([weakRoom, peerId] {
        if (auto room = weakRoom.lock()) {
            room->Loop_->EnqueueTask([room, peerId] {
                room->HandlePeerDown(peerId);
            });
        }
    });

    Participants_[peerId] = PeerHandle{endpoint, monitor};
    std::cout << "[Room " << Id_ << "] Peer " << ShortId(peerId) << " registered ("
              << Participants_.size() << " in room)" << std::endl;

    if (!SendToEngine(CommandKind::AddPeer, peerId)) {
        auto handle = Participants_.at(peerId);
        Participants_.erase(peerId);
        DetachPeer(peerId, handle, "media engine rejected the peer");
        MaybeRetire();
    }
}

void Room::HandleClientEvent(const PeerId& peerId, Payload&& payload) {
    if (State_ != RoomState::Active || !Participants_.count(peerId)) {
        // Expected when a peer's last events race its removal.
        return;
    }

    SendToEngine(CommandKind::MediaEvent, peerId, std::move(payload));
}

void Room::HandleEngineEvent(EngineEvent&& event) {
    switch (event.kind) {
        case EventKind::MediaEvent:
            if (event.target) {
                DeliverTo(*event.target, event.data);
            } else {
                for (auto& [id, handle] : Participants_) {
                    DeliverTo(id, event.data);
                }
            }
            break;

        case EventKind::PeerReady:
            if (event.target) {
                std::cout << "[Room " << Id_ << "] Engine accepted peer " << ShortId(*event.target) << std::endl;
            }
            break;

        case EventKind::PeerFailed: {
            if (!event.target) {
                break;
            }
            auto it = Participants_.find(*event.target);
            if (it == Participants_.end()) {
                break;
            }
            std::cerr << "[Room " << Id_ << "] Engine reported failure of peer " << ShortId(*event.target) << std::endl;
            auto handle = it->second;
            RemovePeer(*event.target, "media failure");
            DetachPeer(*event.target, handle, "media connection failed");
            MaybeRetire();
            break;
        }

        case EventKind::ShutdownComplete:
            if (State_ == RoomState::Terminating) {
                std::cout << "[Room " << Id_ << "] Engine shut down" << std::endl;
                Finish();
            }
            break;

        case EventKind::Crashed:
            if (State_ == RoomState::Terminated) {
                break;
            }
            std::cerr << "[Room " << Id_ << "] Media engine failed: " << event.data.dump()
                      << ", closing room with " << Participants_.size() << " peers" << std::endl;
            DetachAll("media engine failed");
            if (State_ == RoomState::Active && Hooks_.tryRetire) {
                Hooks_.tryRetire(true);
            }
            Finish();
            break;
    }
}

void Room::HandlePeerDown(const PeerId& peerId) {
    if (RemovePeer(peerId, "connection lost")) {
        MaybeRetire();
    }
}

void Room::HandleShutdown() {
    if (State_ != RoomState::Active) {
        return;
    }

    std::cout << "[Room " << Id_ << "] Shutdown requested" << std::endl;
    DetachAll("server is shutting down");
    if (Hooks_.tryRetire) {
        Hooks_.tryRetire(true);
    }
    BeginTermination();
}

void Room::DeliverTo(const PeerId& peerId, const Payload& payload) {
    auto it = Participants_.find(peerId);
    if (it == Participants_.end()) {
        return;
    }

    // An expired endpoint is followed by its lifeline notification.
    if (auto endpoint = it->second.endpoint.lock()) {
        endpoint->OnRoomEvent(payload);
    }
}

bool Room::RemovePeer(const PeerId& peerId, const char* reason) {
    auto it = Participants_.find(peerId);
    if (it == Participants_.end()) {
        return false;
    }

    if (auto endpoint = it->second.endpoint.lock()) {
        endpoint->GetLifeline().Unwatch(it->second.monitor);
    }
    Participants_.erase(it);

    std::cout << "[Room " << Id_ << "] Peer " << ShortId(peerId) << " removed (" << reason << ", "
              << Participants_.size() << " left)" << std::endl;

    SendToEngine(CommandKind::RemovePeer, peerId);
    return true;
}

void Room::DetachPeer(const PeerId& peerId, const PeerHandle& handle, const std::string& reason) {
    if (auto endpoint = handle.endpoint.lock()) {
        endpoint->GetLifeline().Unwatch(handle.monitor);
        endpoint->OnRoomDetached(peerId, Id_, reason);
    }
}

void Room::DetachAll(const std::string& reason) {
    auto participants = std::move(Participants_);
    Participants_.clear();

    for (auto& [id, handle] : participants) {
        DetachPeer(id, handle, reason);
    }
}

bool Room::SendToEngine(CommandKind kind, const PeerId& peerId, Payload data) {
    if (!Engine_) {
        return false;
    }

    try {
        Engine_->Command(EngineCommand{kind, peerId, std::move(data)});
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[Room " << Id_ << "] Engine rejected " << ToString(kind);
        if (!peerId.empty()) {
            std::cerr << " for peer " << ShortId(peerId);
        }
        std::cerr << ": " << e.what() << std::endl;
        return false;
    }
}

void Room::MaybeRetire() {
    if (State_ != RoomState::Active || !Participants_.empty()) {
        return;
    }

    if (Hooks_.tryRetire && !Hooks_.tryRetire(false)) {
        // A join is on its way.
        return;
    }

    std::cout << "[Room " << Id_ << "] Last peer left" << std::endl;
    BeginTermination();
}

void Room::BeginTermination() {
    State_ = RoomState::Terminating;

    if (!SendToEngine(CommandKind::Shutdown, PeerId{})) {
        Finish();
        return;
    }

    Loop_->EnqueueTaskAfter(Options_.shutdownTimeout, [self = shared_from_this()] {
        if (self->State_ == RoomState::Terminating) {
            std::cerr << "[Room " << self->Id_ << "] Engine shutdown timed out" << std::endl;
            self->Finish();
        }
    });
}

void Room::Finish() {
    if (State_ == RoomState::Terminated) {
        return;
    }
    State_ = RoomState::Terminated;

    DetachAll("room closed");
    Engine_.reset();

    if (Hooks_.onTerminated) {
        Hooks_.onTerminated(*this);
    }

    // Registrations already queued still run and are turned away with a
    // detach; every other queued message finds the room terminated.
    Loop_->Close();
    std::cout << "[Room " << Id_ << "] Terminated" << std::endl;
    TerminatedPromise_.set_value();
}

} // namespace huddle
