#pragma once
#include <chrono>
#include <functional>
#include <memory>

namespace boa::platform {

class EventLoop;

// A callback scheduled on an EventLoop. Destroying or cancelling the timer
// guarantees the callback will not run afterwards; replacing a one-shot
// timer is how watch mode debounces bursts of change events.
class Timer {
public:
    using Callback = std::function<void()>;

    static std::unique_ptr<Timer> one_shot(
        EventLoop& loop,
        std::chrono::milliseconds delay,
        Callback callback);

    static std::unique_ptr<Timer> repeating(
        EventLoop& loop,
        std::chrono::milliseconds interval,
        Callback callback);

    ~Timer();

    void cancel();

    // False once cancelled, or once a one-shot timer has fired.
    bool is_active() const;

private:
    Timer() = default;
    struct State;
    static void schedule(const std::shared_ptr<State>& state);

    std::shared_ptr<State> state_;
};

} // namespace boa::platform
