#include "participant.hpp"

namespace huddle {

Participant::Participant(const std::shared_ptr<rtc::PeerConnection>& peerConnection)
    : PeerConnection_(peerConnection)
{ }

void Participant::AddIncomingTrack(const std::shared_ptr<rtc::Track>& track) {
    IncomingTracks_.push_back(track);

    track->onMessage([this, mid = track->mid()](rtc::binary message) {
        std::lock_guard<std::mutex> lock(TracksMutex_);

        auto it = Forwards_.find(mid);
        if (it == Forwards_.end()) {
            return;
        }
        for (auto& [id, target] : it->second) {
            if (target->isOpen()) {
                target->send(message);
            }
        }
    }, nullptr);
}

void Participant::RemoveForwards(const PeerId& peerId) {
    std::lock_guard guard(TracksMutex_);
    for (auto& [mid, targets] : Forwards_) {
        targets.erase(peerId);
    }
}

void Participant::Negotiate() {
    if (!NeedsNegotiation_) {
        return;
    }
    if (PeerConnection_->state() == rtc::PeerConnection::State::Connected) {
        NeedsNegotiation_ = false;
        PeerConnection_->setLocalDescription(rtc::Description::Type::Offer);
    }
}

void Participant::Close() {
    for (auto& track : IncomingTracks_) {
        track->resetCallbacks();
        track->close();
    }

    {
        std::lock_guard guard(TracksMutex_);
        Forwards_.clear();
    }

    PeerConnection_->close();
}

} // namespace huddle
