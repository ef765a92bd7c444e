#pragma once

#include "fwd.hpp"

#include <rtc/rtc.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace huddle {

// Media side of one peer inside RtcEngine: its PeerConnection, the tracks it
// publishes and where their packets are forwarded.
class Participant {
public:
    Participant(const std::shared_ptr<rtc::PeerConnection>& peerConnection);

    // Packets arriving on the track go to every forward registered for its mid.
    void AddIncomingTrack(const std::shared_ptr<rtc::Track>& track);

    const std::vector<std::shared_ptr<rtc::Track>>& GetIncomingTracks() const {
        return IncomingTracks_;
    }

    void AddForward(const std::string& mid, const PeerId& peerId, const std::shared_ptr<rtc::Track>& track) {
        std::lock_guard guard(TracksMutex_);
        Forwards_[mid][peerId] = track;
    }

    void RemoveForwards(const PeerId& peerId);

    std::shared_ptr<rtc::PeerConnection> GetConnection() {
        return PeerConnection_;
    }

    // Sends a new offer once connected if tracks were added since the last one.
    void Negotiate();

    void RequestNegotiation() {
        NeedsNegotiation_ = true;
    }

    void Close();

private:
    std::shared_ptr<rtc::PeerConnection> PeerConnection_;
    std::vector<std::shared_ptr<rtc::Track>> IncomingTracks_;
    std::atomic<bool> NeedsNegotiation_{false};

    std::mutex TracksMutex_;
    std::unordered_map<std::string, std::unordered_map<PeerId, std::shared_ptr<rtc::Track>>> Forwards_;
};

} // namespace huddle
