#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace huddle {

using MonitorToken = uint64_t;

// Liveness monitor of one unit. Watchers are told exactly once that the unit
// terminated, whatever the cause.
class Lifeline {
public:
    using DownCallback = std::function<void()>;

    // Fires the callback right away if the unit is already gone.
    MonitorToken Watch(DownCallback callback);
    void Unwatch(MonitorToken token);

    // Later calls are no-ops.
    void Terminate();

    // Introspection for tests; the room relies on watch callbacks only.
    bool IsTerminated() const;
    size_t WatcherCount() const;

private:
    mutable std::mutex Mutex_;
    bool Terminated_ = false;
    MonitorToken NextToken_ = 1;
    std::unordered_map<MonitorToken, DownCallback> Watchers_;
};

} // namespace huddle
