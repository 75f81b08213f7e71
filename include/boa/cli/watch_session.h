#pragma once

#include <boa/compiler.h>
#include <boa/core/config.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace boa::core {
class DiagnosticEmitter;
}

namespace boa::platform {
class EventLoop;
class Timer;
}

namespace boa::cli {

struct WatchConfig {
    std::string input_path;
    std::string output_path;
    CompileOptions compile;
    std::chrono::milliseconds debounce = core::config::kWatchDebounce;
};

// Recompiles one input file on change. Change notifications are debounced:
// each one restarts the timer, and only its expiry reads and compiles the
// file. Output is only rewritten when the source text differs from the last
// text that was compiled successfully (or attempted on the initial pass).
class WatchSession {
public:
    WatchSession(platform::EventLoop& loop, WatchConfig config,
                 core::DiagnosticEmitter& diagnostics);
    ~WatchSession();

    WatchSession(const WatchSession&) = delete;
    WatchSession& operator=(const WatchSession&) = delete;

    // First compile. Returns false (with `err`) only when the input cannot
    // be read; a compile failure is reported and watching continues.
    bool compile_initial(std::string& err);

    // Restarts the debounce timer.
    void notify_change();

    // Re-reads and recompiles now. Returns true when output was written.
    bool recompile();

    bool has_pending_change() const;
    std::size_t write_count() const { return write_count_; }
    std::size_t skipped_count() const { return skipped_count_; }
    bool last_compile_ok() const { return last_compile_ok_; }

private:
    // Reports failures through the diagnostics emitter.
    void compile_and_write(const std::string& source, const char* stage);
    std::string compiled_message() const;

    platform::EventLoop& loop_;
    WatchConfig config_;
    core::DiagnosticEmitter& diagnostics_;
    std::unique_ptr<platform::Timer> debounce_;
    std::string previous_source_;
    std::size_t write_count_ = 0;
    std::size_t skipped_count_ = 0;
    bool last_compile_ok_ = false;
};

}  // namespace boa::cli
