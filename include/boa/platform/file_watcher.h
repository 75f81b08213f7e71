#pragma once
#include <boa/core/config.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>

namespace boa::platform {

class EventLoop;
class Timer;

// Polls one path for changes on an EventLoop. A change is any difference in
// existence, modification time or size since the previous poll, so a file
// replaced through a rename is reported too.
class FileWatcher {
public:
    using ChangeCallback = std::function<void()>;

    FileWatcher(EventLoop& loop, std::filesystem::path path,
                std::chrono::milliseconds poll_interval = core::config::kWatchPollInterval);
    ~FileWatcher();

    FileWatcher(const FileWatcher&) = delete;
    FileWatcher& operator=(const FileWatcher&) = delete;

    void start(ChangeCallback on_change);
    void stop();
    bool is_watching() const;

    // Checks the path once; invokes the callback and returns true on change.
    bool poll();

    const std::filesystem::path& path() const { return path_; }

private:
    struct Snapshot {
        bool exists = false;
        std::filesystem::file_time_type modified{};
        std::uintmax_t size = 0;

        bool operator==(const Snapshot& other) const {
            return exists == other.exists && modified == other.modified && size == other.size;
        }
    };

    Snapshot take_snapshot() const;

    EventLoop& loop_;
    std::filesystem::path path_;
    std::chrono::milliseconds poll_interval_;
    ChangeCallback on_change_;
    Snapshot last_;
    std::unique_ptr<Timer> poll_timer_;
};

} // namespace boa::platform
