#include "endpoint.hpp"

#include "channel.hpp"
#include "ids.hpp"
#include "protocol.hpp"
#include "registry.hpp"
#include "room.hpp"

#include <iostream>

namespace huddle {

PeerEndpoint::PeerEndpoint(std::shared_ptr<Channel> channel, RoomRegistry& registry)
    : Channel_(std::move(channel))
    , Registry_(registry)
    , Loop_(std::make_shared<Loop>())
{ }

void PeerEndpoint::Start() {
    std::weak_ptr<PeerEndpoint> weakSelf = shared_from_this();

    Channel_->OnMessage([weakSelf](std::string message) {
        if (auto self = weakSelf.lock()) {
            self->Post([self, message = std::move(message)] {
                self->HandleChannelMessage(message);
            });
        }
    });

    Channel_->OnClosed([weakSelf] {
        if (auto self = weakSelf.lock()) {
            self->Terminate();
        }
    });

    StartLoopThread(Loop_);
}

JoinResult PeerEndpoint::OnJoinRequest(const std::string& roomTarget) {
    RoomId roomId;
    try {
        roomId = ParseRoomTarget(roomTarget);
    } catch (const RoomTargetError& e) {
        std::cerr << "[Peer] Rejecting join for '" << roomTarget << "': " << e.what() << std::endl;
        return JoinError{e.what()};
    }

    auto result = Registry_.FindOrStart(roomId);
    if (auto error = std::get_if<StartError>(&result)) {
        std::cerr << "[Peer] Could not join room " << roomId << ": " << error->cause << std::endl;
        return JoinError{"room " + roomId + " could not be started: " + error->cause};
    }

    auto room = std::get<std::shared_ptr<Room>>(result);
    auto peerId = GeneratePeerId();

    if (!room->RegisterPeer(peerId, weak_from_this())) {
        std::cerr << "[Peer " << ShortId(peerId) << "] Room " << roomId << " closed during join" << std::endl;
        return JoinError{"room " + roomId + " is closing"};
    }

    Session_ = SessionContext{roomId, room, peerId};
    std::cout << "[Peer " << ShortId(peerId) << "] Joined room " << roomId << std::endl;
    return *Session_;
}

void PeerEndpoint::OnInboundClientEvent(const SessionContext& session, Payload payload) {
    if (auto room = session.room.lock()) {
        room->RelayClientEvent(session.peerId, std::move(payload));
    }
}

void PeerEndpoint::OnRoomEvent(Payload payload) {
    Post([self = shared_from_this(), payload = std::move(payload)] {
        self->Channel_->Send(protocol::MakeMediaEvent(payload));
    });
}

void PeerEndpoint::OnRoomDetached(const PeerId& peerId, const RoomId& roomId, std::string reason) {
    Post([self = shared_from_this(), peerId, roomId, reason = std::move(reason)] {
        if (!self->Session_ || self->Session_->peerId != peerId) {
            return;
        }
        std::cout << "[Peer " << ShortId(peerId) << "] Detached from room " << roomId << ": " << reason << std::endl;
        self->Session_.reset();
        self->Channel_->Send(protocol::MakeRoomClosed(roomId, reason));
    });
}

void PeerEndpoint::Close() {
    Channel_->Close();
}

void PeerEndpoint::Terminate() {
    // Queued so that messages already received reach the room first.
    bool queued = Loop_->EnqueueTask([self = shared_from_this()] {
        if (self->Session_) {
            std::cout << "[Peer " << ShortId(self->Session_->peerId) << "] Channel closed" << std::endl;
        }
        self->Lifeline_.Terminate();
        self->Loop_->Stop();
    });

    if (!queued) {
        Lifeline_.Terminate();
    }
}

void PeerEndpoint::Post(Task&& task) {
    // A stopped endpoint has nobody left to talk to.
    Loop_->EnqueueTask(std::move(task));
}

void PeerEndpoint::HandleChannelMessage(const std::string& message) {
    protocol::ClientMessage parsed;
    try {
        parsed = protocol::ParseClientMessage(message);
    } catch (const protocol::ProtocolError& e) {
        std::cerr << "[Peer] Bad signaling message: " << e.what() << std::endl;
        Channel_->Send(protocol::MakeError(e.what()));
        return;
    }

    if (auto join = std::get_if<protocol::Join>(&parsed)) {
        if (Session_) {
            Channel_->Send(protocol::MakeJoinError("already joined room " + Session_->roomId));
            return;
        }

        auto result = OnJoinRequest(join->topic);
        if (auto session = std::get_if<SessionContext>(&result)) {
            Channel_->Send(protocol::MakeJoined(session->roomId, session->peerId));
        } else {
            Channel_->Send(protocol::MakeJoinError(std::get<JoinError>(result).reason));
        }
    }
    else if (auto event = std::get_if<protocol::MediaEvent>(&parsed)) {
        if (!Session_) {
            Channel_->Send(protocol::MakeError("not in a room"));
            return;
        }
        OnInboundClientEvent(*Session_, std::move(event->data));
    }
    else if (std::holds_alternative<protocol::Leave>(parsed)) {
        if (!Session_) {
            Channel_->Send(protocol::MakeError("not in a room"));
            return;
        }
        if (auto room = Session_->room.lock()) {
            room->LeavePeer(Session_->peerId);
        }
        auto roomId = Session_->roomId;
        Session_.reset();
        Channel_->Send(protocol::MakeLeft(roomId));
    }
    else if (std::holds_alternative<protocol::Ping>(parsed)) {
        Channel_->Send(protocol::MakePong());
    }
}

} // namespace huddle
