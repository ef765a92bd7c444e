#include "rtc_engine.hpp"

#include "ids.hpp"
#include "loop.hpp"
#include "participant.hpp"

#include <rtc/rtc.hpp>

#include <atomic>
#include <iostream>
#include <unordered_map>

namespace huddle {

namespace {

using json = nlohmann::json;

const char* ToString(rtc::PeerConnection::State state) {
    switch (state) {
        case rtc::PeerConnection::State::New: return "New";
        case rtc::PeerConnection::State::Connecting: return "Connecting";
        case rtc::PeerConnection::State::Connected: return "Connected";
        case rtc::PeerConnection::State::Disconnected: return "Disconnected";
        case rtc::PeerConnection::State::Failed: return "Failed";
        case rtc::PeerConnection::State::Closed: return "Closed";
    }
    return "Unknown";
}

} // namespace

// Engine state lives on its own loop. libdatachannel callbacks hop onto it
// before touching anything but a participant's forwarding table.
struct RtcEngine::Impl : std::enable_shared_from_this<RtcEngine::Impl> {
    RoomId roomId;
    rtc::Configuration config;
    std::shared_ptr<Loop> loop = std::make_shared<Loop>();
    EventCallback emit;
    std::atomic<bool> shutDown{false};

    std::unordered_map<PeerId, std::shared_ptr<Participant>> participants;

    void Post(Task&& task) {
        loop->EnqueueTask(std::move(task));
    }

    void Emit(EventKind kind, std::optional<PeerId> target, Payload data = {}) {
        if (emit) {
            emit(EngineEvent{kind, std::move(target), std::move(data)});
        }
    }

    void Dispatch(EngineCommand& command);
    void AddPeer(const PeerId& peerId);
    void RemovePeer(const PeerId& peerId);
    void HandleMediaEvent(const PeerId& peerId, const Payload& data);
    void HandleTrack(const PeerId& peerId, const std::shared_ptr<rtc::Track>& track);
    void Forward(const PeerId& fromId, const std::shared_ptr<Participant>& source,
                 const std::shared_ptr<rtc::Track>& track,
                 const PeerId& toId, const std::shared_ptr<Participant>& sink);
    void CloseAll();
};

void RtcEngine::Impl::Dispatch(EngineCommand& command) {
    switch (command.kind) {
        case CommandKind::AddPeer:
            AddPeer(command.peer);
            break;
        case CommandKind::RemovePeer:
            RemovePeer(command.peer);
            break;
        case CommandKind::MediaEvent:
            HandleMediaEvent(command.peer, command.data);
            break;
        case CommandKind::Shutdown:
            CloseAll();
            std::cout << "[Engine " << roomId << "] Shut down" << std::endl;
            Emit(EventKind::ShutdownComplete, std::nullopt);
            loop->Stop();
            break;
    }
}

void RtcEngine::Impl::AddPeer(const PeerId& peerId) {
    if (participants.count(peerId)) {
        std::cerr << "[Engine " << roomId << "] Peer " << ShortId(peerId) << " already added" << std::endl;
        return;
    }

    std::shared_ptr<rtc::PeerConnection> pc;
    try {
        pc = std::make_shared<rtc::PeerConnection>(config);
    } catch (const std::exception& e) {
        std::cerr << "[Engine " << roomId << "] Creating PeerConnection for " << ShortId(peerId)
                  << " failed: " << e.what() << std::endl;
        Emit(EventKind::PeerFailed, peerId, json{{"reason", e.what()}});
        return;
    }

    std::weak_ptr<Impl> weakSelf = shared_from_this();

    pc->onLocalDescription([weakSelf, peerId](rtc::Description desc) {
        json message = {
            {"type", desc.typeString()},
            {"sdp", std::string(desc)}
        };
        if (auto self = weakSelf.lock()) {
            self->Post([self, peerId, message = std::move(message)]() mutable {
                self->Emit(EventKind::MediaEvent, peerId, std::move(message));
            });
        }
    });

    pc->onLocalCandidate([weakSelf, peerId](rtc::Candidate cand) {
        if (cand.candidate().empty()) {
            return;
        }
        json message = {
            {"type", "candidate"},
            {"candidate", cand.candidate()},
            {"sdpMid", cand.mid()}
        };
        if (auto self = weakSelf.lock()) {
            self->Post([self, peerId, message = std::move(message)]() mutable {
                self->Emit(EventKind::MediaEvent, peerId, std::move(message));
            });
        }
    });

    pc->onStateChange([weakSelf, peerId](rtc::PeerConnection::State state) {
        auto self = weakSelf.lock();
        if (!self) {
            return;
        }
        std::cout << "[Engine " << self->roomId << "] Peer " << ShortId(peerId) << " PC state: " << ToString(state) << std::endl;

        self->Post([self, peerId, state] {
            auto it = self->participants.find(peerId);
            if (it == self->participants.end()) {
                return;
            }
            if (state == rtc::PeerConnection::State::Connected) {
                it->second->Negotiate();
            } else if (state == rtc::PeerConnection::State::Failed) {
                self->Emit(EventKind::PeerFailed, peerId, json{{"reason", "peer connection failed"}});
            }
        });
    });

    pc->onTrack([weakSelf, peerId](std::shared_ptr<rtc::Track> track) {
        if (auto self = weakSelf.lock()) {
            self->Post([self, peerId, track] {
                self->HandleTrack(peerId, track);
            });
        }
    });

    auto participant = std::make_shared<Participant>(pc);
    participants.emplace(peerId, participant);

    for (auto& [id, other] : participants) {
        if (id == peerId) {
            continue;
        }
        for (auto& track : other->GetIncomingTracks()) {
            Forward(id, other, track, peerId, participant);
        }
    }

    std::cout << "[Engine " << roomId << "] Peer " << ShortId(peerId) << " added" << std::endl;
    Emit(EventKind::PeerReady, peerId);
}

void RtcEngine::Impl::RemovePeer(const PeerId& peerId) {
    auto it = participants.find(peerId);
    if (it == participants.end()) {
        return;
    }

    auto participant = it->second;
    participants.erase(it);

    for (auto& [id, other] : participants) {
        other->RemoveForwards(peerId);
    }
    participant->Close();

    std::cout << "[Engine " << roomId << "] Peer " << ShortId(peerId) << " removed" << std::endl;
}

void RtcEngine::Impl::HandleMediaEvent(const PeerId& peerId, const Payload& data) {
    auto it = participants.find(peerId);
    if (it == participants.end()) {
        std::cerr << "[Engine " << roomId << "] Media event for unknown peer " << ShortId(peerId) << std::endl;
        return;
    }

    auto typeIt = data.find("type");
    if (typeIt == data.end() || !typeIt->is_string()) {
        std::cerr << "[Engine " << roomId << "] Peer " << ShortId(peerId) << " sent a media event without type" << std::endl;
        return;
    }

    auto& participant = it->second;
    auto pc = participant->GetConnection();
    const std::string type = *typeIt;

    try {
        if (type == "offer" || type == "answer") {
            auto sdpIt = data.find("sdp");
            if (sdpIt == data.end() || !sdpIt->is_string()) {
                std::cerr << "[Engine " << roomId << "] Peer " << ShortId(peerId) << " sent " << type << " without sdp" << std::endl;
                return;
            }
            pc->setRemoteDescription(rtc::Description(sdpIt->get<std::string>(), type));
            if (type == "offer") {
                pc->setLocalDescription();
            }
            participant->Negotiate();
        }
        else if (type == "candidate") {
            std::string candidate = data.value("candidate", "");
            if (candidate.empty()) {
                return;
            }
            pc->addRemoteCandidate(rtc::Candidate(candidate, data.value("sdpMid", "")));
        }
        else {
            std::cout << "[Engine " << roomId << "] Peer " << ShortId(peerId) << " sent unknown media event: " << type << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Engine " << roomId << "] Peer " << ShortId(peerId) << " " << type << " rejected: " << e.what() << std::endl;
    }
}

void RtcEngine::Impl::HandleTrack(const PeerId& peerId, const std::shared_ptr<rtc::Track>& track) {
    auto it = participants.find(peerId);
    if (it == participants.end()) {
        return;
    }

    auto source = it->second;
    source->AddIncomingTrack(track);

    for (auto& [id, other] : participants) {
        if (id == peerId) {
            continue;
        }
        Forward(peerId, source, track, id, other);
    }
}

void RtcEngine::Impl::Forward(const PeerId& fromId, const std::shared_ptr<Participant>& source,
                              const std::shared_ptr<rtc::Track>& track,
                              const PeerId& toId, const std::shared_ptr<Participant>& sink)
{
    auto mid = ShortId(fromId) + "-" + track->mid();
    std::shared_ptr<rtc::Track> outgoing;

    if (track->description().type() == "video") {
        rtc::Description::Video media(mid, rtc::Description::Direction::SendOnly);
        media.addVP8Codec(96);
        outgoing = sink->GetConnection()->addTrack(media);
    } else {
        rtc::Description::Audio media(mid, rtc::Description::Direction::SendOnly);
        media.addOpusCodec(111);
        outgoing = sink->GetConnection()->addTrack(media);
    }

    std::cout << "[Engine " << roomId << "] Forwarding track " << track->mid() << " from "
              << ShortId(fromId) << " to " << ShortId(toId) << std::endl;

    source->AddForward(track->mid(), toId, outgoing);
    sink->RequestNegotiation();
    sink->Negotiate();
}

void RtcEngine::Impl::CloseAll() {
    for (auto& [id, participant] : participants) {
        participant->Close();
    }
    participants.clear();
}

RtcEngine::RtcEngine(RoomId roomId, Options options)
    : Impl_(std::make_shared<Impl>())
{
    Impl_->roomId = std::move(roomId);
    Impl_->config.disableAutoNegotiation = true;
    for (auto& server : options.iceServers) {
        Impl_->config.iceServers.emplace_back(server);
    }

    StartLoopThread(Impl_->loop);
}

RtcEngine::~RtcEngine() {
    Impl_->shutDown = true;
    Impl_->loop->EnqueueTask([impl = Impl_] {
        impl->CloseAll();
        impl->loop->Stop();
    });
}

void RtcEngine::OnEvent(EventCallback callback) {
    Impl_->emit = std::move(callback);
}

void RtcEngine::Command(EngineCommand&& command) {
    if (Impl_->shutDown) {
        throw EngineError("engine is shut down");
    }
    if (command.kind == CommandKind::Shutdown) {
        Impl_->shutDown = true;
    }

    bool queued = Impl_->loop->EnqueueTask([impl = Impl_, command = std::move(command)]() mutable {
        try {
            impl->Dispatch(command);
        } catch (const std::exception& e) {
            std::cerr << "[Engine " << impl->roomId << "] Failed on " << ToString(command.kind)
                      << ": " << e.what() << std::endl;
            impl->shutDown = true;
            impl->CloseAll();
            impl->Emit(EventKind::Crashed, std::nullopt, json{{"reason", e.what()}});
            impl->loop->Stop();
        }
    });

    if (!queued) {
        throw EngineError("engine loop is stopped");
    }
}

EngineFactory RtcEngine::Factory(Options options) {
    return [options](const RoomId& roomId) -> std::unique_ptr<MediaEngine> {
        return std::make_unique<RtcEngine>(roomId, options);
    };
}

} // namespace huddle
