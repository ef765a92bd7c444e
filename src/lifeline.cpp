#include "lifeline.hpp"

namespace huddle {

MonitorToken Lifeline::Watch(DownCallback callback) {
    MonitorToken token;
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        token = NextToken_++;
        if (!Terminated_) {
            Watchers_.emplace(token, std::move(callback));
            return token;
        }
    }

    if (callback) {
        callback();
    }
    return token;
}

void Lifeline::Unwatch(MonitorToken token) {
    std::lock_guard<std::mutex> lock(Mutex_);
    Watchers_.erase(token);
}

void Lifeline::Terminate() {
    std::unordered_map<MonitorToken, DownCallback> watchers;
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        if (Terminated_) {
            return;
        }
        Terminated_ = true;
        std::swap(watchers, Watchers_);
    }

    for (auto& watcher : watchers) {
        if (watcher.second) {
            watcher.second();
        }
    }
}

bool Lifeline::IsTerminated() const {
    std::lock_guard<std::mutex> lock(Mutex_);
    return Terminated_;
}

size_t Lifeline::WatcherCount() const {
    std::lock_guard<std::mutex> lock(Mutex_);
    return Watchers_.size();
}

} // namespace huddle
