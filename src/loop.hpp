#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <queue>

namespace huddle {

using Task = std::function<void()>;

// Mailbox drained by a single thread. Tasks run one at a time in the order
// they were enqueued; delayed tasks join the queue once their deadline passes.
class Loop {
public:
    using Clock = std::chrono::steady_clock;

    // Both return false once the loop is stopped; the task is dropped.
    bool EnqueueTask(Task&& task);
    bool EnqueueTaskAfter(std::chrono::milliseconds delay, Task&& task);

    void Run();

    // Run() returns after the task in progress. Pending tasks are discarded.
    void Stop();

    // Stops accepting tasks; Run() returns once the tasks already queued have
    // run. Pending timers are discarded.
    void Close();

    // True once Stop() or Close() was called. Introspection for tests; owners
    // go by the result of EnqueueTask.
    bool IsStopped() const;

private:
    void PromoteDueTimers();

private:
    mutable std::mutex Mutex_;
    std::condition_variable Cv_;
    std::queue<Task> TaskQueue_;
    std::multimap<Clock::time_point, Task> Timers_;
    bool Stopped_ = false;
    bool Closing_ = false;
};

// Runs the loop on a detached thread. The thread holds a reference to the
// loop until Run() returns.
void StartLoopThread(const std::shared_ptr<Loop>& loop);

} // namespace huddle
