#include "loop.hpp"

#include <thread>

namespace huddle {

void Loop::Run() {
    while (true)
    {
        Task task;

        {
            std::unique_lock<std::mutex> lock(Mutex_);
            while (true) {
                if (!Closing_) {
                    PromoteDueTimers();
                }
                if (Stopped_ || Closing_ || !TaskQueue_.empty()) {
                    break;
                }
                if (Timers_.empty()) {
                    Cv_.wait(lock);
                } else {
                    Cv_.wait_until(lock, Timers_.begin()->first);
                }
            }
            if (Stopped_ || TaskQueue_.empty()) {
                break;
            }
            task = std::move(TaskQueue_.front());
            TaskQueue_.pop();
        }
        task();
    }

    // Destroy leftovers outside the lock, their captures may own the loop's owner.
    std::queue<Task> pending;
    std::multimap<Clock::time_point, Task> timers;
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        std::swap(pending, TaskQueue_);
        std::swap(timers, Timers_);
    }
}

bool Loop::EnqueueTask(Task&& task) {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        if (Stopped_ || Closing_) {
            return false;
        }
        TaskQueue_.push(std::move(task));
    }

    Cv_.notify_one();
    return true;
}

bool Loop::EnqueueTaskAfter(std::chrono::milliseconds delay, Task&& task) {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        if (Stopped_ || Closing_) {
            return false;
        }
        Timers_.emplace(Clock::now() + delay, std::move(task));
    }

    Cv_.notify_one();
    return true;
}

void Loop::Stop() {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        Stopped_ = true;
    }

    Cv_.notify_all();
}

void Loop::Close() {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        Closing_ = true;
    }

    Cv_.notify_all();
}

bool Loop::IsStopped() const {
    std::lock_guard<std::mutex> lock(Mutex_);
    return Stopped_ || Closing_;
}

void Loop::PromoteDueTimers() {
    const auto now = Clock::now();
    while (!Timers_.empty() && Timers_.begin()->first <= now) {
        TaskQueue_.push(std::move(Timers_.begin()->second));
        Timers_.erase(Timers_.begin());
    }
}

void StartLoopThread(const std::shared_ptr<Loop>& loop) {
    std::thread{std::bind(&Loop::Run, loop)}.detach();
}

} // namespace huddle
