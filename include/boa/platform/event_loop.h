#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <queue>
#include <vector>

namespace boa::platform {

// Single-consumer task loop driving watch mode. Tasks may be posted from any
// thread; they always run on the thread calling run()/run_pending().
class EventLoop {
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    EventLoop() = default;
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post_task(Task task);
    void post_delayed_task(Task task, std::chrono::milliseconds delay);

    // Blocks until quit() is called.
    void run();

    // Runs every task that is due now, then returns.
    void run_pending();

    // Runs the loop for at most `duration`, or until quit().
    void run_for(std::chrono::milliseconds duration);

    void quit();
    bool is_running() const;
    size_t pending_count() const;

private:
    struct DelayedTask {
        TimePoint run_at;
        Task task;
        bool operator>(const DelayedTask& other) const {
            return run_at > other.run_at;
        }
    };

    // Moves due delayed tasks to the immediate queue. Caller holds mutex_.
    void promote_due_tasks(TimePoint now);
    void run_until(TimePoint deadline, bool bounded);

    std::deque<Task> tasks_;
    std::priority_queue<DelayedTask, std::vector<DelayedTask>, std::greater<>> delayed_tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};
    std::atomic<bool> quit_requested_{false};
};

} // namespace boa::platform
