#include <boa/platform/file_watcher.h>
#include <boa/platform/event_loop.h>
#include <boa/platform/timer.h>

#include <system_error>
#include <utility>

namespace boa::platform {

FileWatcher::FileWatcher(EventLoop& loop, std::filesystem::path path,
                         std::chrono::milliseconds poll_interval)
    : loop_(loop)
    , path_(std::move(path))
    , poll_interval_(poll_interval) {}

FileWatcher::~FileWatcher() {
    stop();
}

void FileWatcher::start(ChangeCallback on_change) {
    on_change_ = std::move(on_change);
    last_ = take_snapshot();
    poll_timer_ = Timer::repeating(loop_, poll_interval_, [this]() { poll(); });
}

void FileWatcher::stop() {
    if (poll_timer_) {
        poll_timer_->cancel();
        poll_timer_.reset();
    }
}

bool FileWatcher::is_watching() const {
    return poll_timer_ && poll_timer_->is_active();
}

bool FileWatcher::poll() {
    Snapshot current = take_snapshot();
    if (current == last_) {
        return false;
    }
    last_ = current;
    if (on_change_) {
        on_change_();
    }
    return true;
}

FileWatcher::Snapshot FileWatcher::take_snapshot() const {
    Snapshot snapshot;
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec) || ec) {
        return snapshot;
    }
    snapshot.exists = true;

    auto modified = std::filesystem::last_write_time(path_, ec);
    if (!ec) snapshot.modified = modified;

    auto size = std::filesystem::file_size(path_, ec);
    if (!ec) snapshot.size = size;
    return snapshot;
}

} // namespace boa::platform
