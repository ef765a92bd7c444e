#pragma once

#include "fwd.hpp"
#include "engine.hpp"
#include "room.hpp"

#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>

namespace huddle {

struct StartError {
    std::string cause;
};

using FindOrStartResult = std::variant<std::shared_ptr<Room>, StartError>;

// Process-wide directory of rooms. Guarantees at most one accepting room per
// id: the entry for a new room is inserted before the room is started, and
// concurrent callers wait for that one start.
class RoomRegistry {
public:
    RoomRegistry(EngineFactory engineFactory, Room::Options roomOptions);
    ~RoomRegistry();

    RoomRegistry(const RoomRegistry&) = delete;
    RoomRegistry& operator=(const RoomRegistry&) = delete;

    // Reserves a join on the returned room; the caller must follow up with
    // Room::RegisterPeer.
    FindOrStartResult FindOrStart(const RoomId& roomId);

    // Removes the entry if it still belongs to this room. Idempotent; a null
    // room matches nothing.
    void OnRoomTerminated(const RoomId& roomId, const Room* room);

    // Started, not retired room for the id, or nullptr.
    std::shared_ptr<Room> Find(const RoomId& roomId) const;

    size_t Size() const;

    // Terminates every room and waits for each one, bounded by the room
    // shutdown timeout.
    void Shutdown();

private:
    struct Entry {
        std::shared_future<std::shared_ptr<Room>> room;
        const Room* started = nullptr;
        size_t pendingJoins = 0;
        bool retired = false;
    };

    // Shared with the room hooks, which may run after the registry is gone.
    struct Directory {
        mutable std::mutex mutex;
        std::unordered_map<RoomId, std::shared_ptr<Entry>> rooms;
    };

    // Caller holds directory.mutex.
    static void EraseIfCurrent(Directory& directory, const RoomId& roomId, const Room* room);

    RoomHooks MakeHooks(const std::weak_ptr<Entry>& entry);

private:
    const EngineFactory EngineFactory_;
    const Room::Options RoomOptions_;

    std::shared_ptr<Directory> Directory_;
};

} // namespace huddle
