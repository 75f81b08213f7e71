#include <boa/platform/timer.h>
#include <boa/platform/event_loop.h>

#include <atomic>
#include <utility>

namespace boa::platform {

// Owned by the Timer; posted tasks only hold a weak reference, so a task
// outliving its Timer does nothing.
struct Timer::State {
    EventLoop& loop;
    std::chrono::milliseconds interval;
    Callback callback;
    std::atomic<bool> cancelled{false};
    std::atomic<bool> fired{false};
    bool repeating = false;

    State(EventLoop& loop_, std::chrono::milliseconds interval_, Callback callback_,
          bool repeating_)
        : loop(loop_)
        , interval(interval_)
        , callback(std::move(callback_))
        , repeating(repeating_) {}
};

void Timer::schedule(const std::shared_ptr<State>& state) {
    std::weak_ptr<State> weak = state;
    state->loop.post_delayed_task(
        [weak]() {
            auto self = weak.lock();
            if (!self || self->cancelled.load()) {
                return;
            }
            if (!self->repeating) {
                self->fired.store(true);
            }
            self->callback();
            if (self->repeating && !self->cancelled.load()) {
                schedule(self);
            }
        },
        state->interval);
}

std::unique_ptr<Timer> Timer::one_shot(EventLoop& loop, std::chrono::milliseconds delay,
                                       Callback callback) {
    auto timer = std::unique_ptr<Timer>(new Timer());
    timer->state_ = std::make_shared<State>(loop, delay, std::move(callback), false);
    schedule(timer->state_);
    return timer;
}

std::unique_ptr<Timer> Timer::repeating(EventLoop& loop, std::chrono::milliseconds interval,
                                        Callback callback) {
    auto timer = std::unique_ptr<Timer>(new Timer());
    timer->state_ = std::make_shared<State>(loop, interval, std::move(callback), true);
    schedule(timer->state_);
    return timer;
}

Timer::~Timer() {
    cancel();
}

void Timer::cancel() {
    if (state_) {
        state_->cancelled.store(true);
    }
}

bool Timer::is_active() const {
    return state_ && !state_->cancelled.load() && !state_->fired.load();
}

} // namespace boa::platform
