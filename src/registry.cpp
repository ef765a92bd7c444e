#include "registry.hpp"

#include <iostream>
#include <vector>

namespace huddle {

RoomRegistry::RoomRegistry(EngineFactory engineFactory, Room::Options roomOptions)
    : EngineFactory_(std::move(engineFactory))
    , RoomOptions_(roomOptions)
    , Directory_(std::make_shared<Directory>())
{ }

RoomRegistry::~RoomRegistry() {
    Shutdown();
}

FindOrStartResult RoomRegistry::FindOrStart(const RoomId& roomId) {
    std::shared_ptr<Entry> entry;
    std::promise<std::shared_ptr<Room>> promise;
    bool starter = false;

    {
        std::lock_guard<std::mutex> lock(Directory_->mutex);
        auto [it, inserted] = Directory_->rooms.try_emplace(roomId);
        if (inserted || it->second->retired) {
            it->second = std::make_shared<Entry>();
            it->second->room = promise.get_future().share();
            starter = true;
        }
        entry = it->second;
        ++entry->pendingJoins;
    }

    if (starter) {
        auto discard = [&] {
            std::lock_guard<std::mutex> lock(Directory_->mutex);
            auto it = Directory_->rooms.find(roomId);
            if (it != Directory_->rooms.end() && it->second == entry) {
                Directory_->rooms.erase(it);
            }
        };

        try {
            auto room = Room::Start(roomId, EngineFactory_, RoomOptions_, MakeHooks(entry));
            promise.set_value(room);

            std::lock_guard<std::mutex> lock(Directory_->mutex);
            entry->started = room.get();
        } catch (const std::exception& e) {
            std::cerr << "[Registry] Room " << roomId << " failed to start: " << e.what() << std::endl;
            discard();
            promise.set_exception(std::current_exception());
            return StartError{e.what()};
        } catch (...) {
            discard();
            promise.set_exception(std::current_exception());
            throw;
        }
    }

    try {
        return entry->room.get();
    } catch (const std::exception& e) {
        return StartError{e.what()};
    }
}

void RoomRegistry::OnRoomTerminated(const RoomId& roomId, const Room* room) {
    std::lock_guard<std::mutex> lock(Directory_->mutex);
    EraseIfCurrent(*Directory_, roomId, room);
}

void RoomRegistry::EraseIfCurrent(Directory& directory, const RoomId& roomId, const Room* room) {
    auto it = directory.rooms.find(roomId);
    if (!room || it == directory.rooms.end() || it->second->started != room) {
        return;
    }

    directory.rooms.erase(it);
    std::cout << "[Registry] Room " << roomId << " removed (" << directory.rooms.size() << " active)" << std::endl;
}

std::shared_ptr<Room> RoomRegistry::Find(const RoomId& roomId) const {
    std::lock_guard<std::mutex> lock(Directory_->mutex);

    auto it = Directory_->rooms.find(roomId);
    if (it == Directory_->rooms.end() || it->second->retired || !it->second->started) {
        return nullptr;
    }
    return it->second->room.get();
}

size_t RoomRegistry::Size() const {
    std::lock_guard<std::mutex> lock(Directory_->mutex);
    return Directory_->rooms.size();
}

void RoomRegistry::Shutdown() {
    std::vector<std::shared_ptr<Room>> rooms;
    {
        std::lock_guard<std::mutex> lock(Directory_->mutex);
        for (auto& [id, entry] : Directory_->rooms) {
            if (entry->started) {
                rooms.push_back(entry->room.get());
            }
        }
    }

    if (rooms.empty()) {
        return;
    }

    std::cout << "[Registry] Shutting down " << rooms.size() << " rooms" << std::endl;
    for (auto& room : rooms) {
        room->Shutdown();
    }
    for (auto& room : rooms) {
        if (!room->WaitTerminated(RoomOptions_.shutdownTimeout * 2)) {
            std::cerr << "[Registry] Room " << room->Id() << " did not terminate in time" << std::endl;
        }
    }
}

RoomHooks RoomRegistry::MakeHooks(const std::weak_ptr<Entry>& weakEntry) {
    std::weak_ptr<Directory> weakDirectory = Directory_;
    RoomHooks hooks;

    hooks.onJoinDelivered = [weakDirectory, weakEntry] {
        auto directory = weakDirectory.lock();
        if (!directory) {
            return;
        }
        std::lock_guard<std::mutex> lock(directory->mutex);
        if (auto entry = weakEntry.lock(); entry && entry->pendingJoins > 0) {
            --entry->pendingJoins;
        }
    };

    hooks.tryRetire = [weakDirectory, weakEntry](bool force) {
        auto directory = weakDirectory.lock();
        if (!directory) {
            return true;
        }
        std::lock_guard<std::mutex> lock(directory->mutex);
        auto entry = weakEntry.lock();
        if (!entry) {
            return true;
        }
        if (!force && entry->pendingJoins > 0) {
            return false;
        }
        entry->retired = true;
        return true;
    };

    hooks.onTerminated = [weakDirectory, weakEntry](const Room& room) {
        auto directory = weakDirectory.lock();
        if (!directory) {
            return;
        }
        std::lock_guard<std::mutex> lock(directory->mutex);
        // The room may end before FindOrStart records it.
        if (auto entry = weakEntry.lock(); entry && !entry->started) {
            entry->started = &room;
        }
        EraseIfCurrent(*directory, room.Id(), &room);
    };

    return hooks;
}

} // namespace huddle
