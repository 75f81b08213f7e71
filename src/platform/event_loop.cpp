#include <boa/platform/event_loop.h>

#include <algorithm>
#include <utility>

namespace boa::platform {

EventLoop::~EventLoop() {
    quit();
}

void EventLoop::post_task(Task task) {
    {
        std::lock_guard lock(mutex_);
        tasks_.emplace_back(std::move(task));
    }
    cv_.notify_one();
}

void EventLoop::post_delayed_task(Task task, std::chrono::milliseconds delay) {
    {
        std::lock_guard lock(mutex_);
        delayed_tasks_.push(DelayedTask{Clock::now() + delay, std::move(task)});
    }
    cv_.notify_one();
}

void EventLoop::promote_due_tasks(TimePoint now) {
    while (!delayed_tasks_.empty() && delayed_tasks_.top().run_at <= now) {
        // top() is const; the task is moved out right before pop().
        tasks_.emplace_back(std::move(const_cast<DelayedTask&>(delayed_tasks_.top()).task));
        delayed_tasks_.pop();
    }
}

void EventLoop::run() {
    run_until(TimePoint::max(), false);
}

void EventLoop::run_for(std::chrono::milliseconds duration) {
    run_until(Clock::now() + duration, true);
}

void EventLoop::run_until(TimePoint deadline, bool bounded) {
    running_.store(true);
    quit_requested_.store(false);

    while (!quit_requested_.load()) {
        std::unique_lock lock(mutex_);
        TimePoint now = Clock::now();
        if (bounded && now >= deadline) break;

        promote_due_tasks(now);
        if (!tasks_.empty()) {
            Task task = std::move(tasks_.front());
            tasks_.pop_front();
            lock.unlock();
            task();
            continue;
        }

        TimePoint wake = deadline;
        if (!delayed_tasks_.empty()) {
            wake = bounded ? std::min(deadline, delayed_tasks_.top().run_at)
                           : delayed_tasks_.top().run_at;
        }
        auto ready = [this]() { return !tasks_.empty() || quit_requested_.load(); };
        if (wake == TimePoint::max()) {
            cv_.wait(lock, ready);
        } else {
            cv_.wait_until(lock, wake, ready);
        }
    }

    running_.store(false);
}

void EventLoop::run_pending() {
    std::deque<Task> due;
    {
        std::lock_guard lock(mutex_);
        promote_due_tasks(Clock::now());
        due.swap(tasks_);
    }

    for (auto& task : due) {
        task();
    }
}

void EventLoop::quit() {
    quit_requested_.store(true);
    cv_.notify_all();
}

bool EventLoop::is_running() const {
    return running_.load();
}

size_t EventLoop::pending_count() const {
    std::lock_guard lock(mutex_);
    return tasks_.size() + delayed_tasks_.size();
}

} // namespace boa::platform
