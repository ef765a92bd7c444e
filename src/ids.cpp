#include "ids.hpp"

#include <cstdint>
#include <random>

namespace huddle {

RoomId ParseRoomTarget(std::string_view target) {
    if (target.substr(0, RoomTargetPrefix.size()) != RoomTargetPrefix) {
        throw RoomTargetError("room target must start with '" + std::string(RoomTargetPrefix) + "'");
    }

    auto id = target.substr(RoomTargetPrefix.size());
    if (id.empty()) {
        throw RoomTargetError("room id is empty");
    }

    for (char c : id) {
        auto uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc == 0x7f) {
            throw RoomTargetError("room id contains whitespace or control characters");
        }
    }

    return RoomId(id);
}

PeerId GeneratePeerId() {
    static constexpr char Digits[] = "0123456789abcdef";
    thread_local std::mt19937_64 generator = [] {
        std::random_device device;
        std::seed_seq seed{device(), device(), device(), device()};
        return std::mt19937_64(seed);
    }();

    PeerId id;
    id.reserve(32);
    for (int half = 0; half < 2; ++half) {
        uint64_t bits = generator();
        for (int i = 0; i < 16; ++i) {
            id.push_back(Digits[bits & 0xf]);
            bits >>= 4;
        }
    }
    return id;
}

std::string ShortId(const PeerId& peerId) {
    return peerId.substr(0, 8);
}

} // namespace huddle
