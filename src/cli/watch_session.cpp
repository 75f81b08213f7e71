#include <boa/cli/watch_session.h>
#include <boa/core/diagnostics.h>
#include <boa/io/source_io.h>
#include <boa/platform/event_loop.h>
#include <boa/platform/timer.h>

#include <utility>

namespace boa::cli {

namespace {

constexpr const char kModule[] = "watch";

}  // namespace

WatchSession::WatchSession(platform::EventLoop& loop, WatchConfig config,
                           core::DiagnosticEmitter& diagnostics)
    : loop_(loop)
    , config_(std::move(config))
    , diagnostics_(diagnostics) {}

WatchSession::~WatchSession() = default;

std::string WatchSession::compiled_message() const {
    std::string message = "compiled " + config_.input_path;
    if (config_.compile.compact) {
        message += " (minified)";
    }
    return message;
}

void WatchSession::compile_and_write(const std::string& source, const char* stage) {
    last_compile_ok_ = false;
    CompileResult result = try_compile(source, config_.compile);
    if (!result.ok) {
        diagnostics_.error(kModule, stage, result.error->what());
        return;
    }

    std::string err;
    if (!io::write_output(result.css, config_.output_path, err)) {
        diagnostics_.error(kModule, stage, err);
        return;
    }

    ++write_count_;
    last_compile_ok_ = true;
    diagnostics_.info(kModule, compiled_message());
}

bool WatchSession::compile_initial(std::string& err) {
    std::string source;
    if (!io::read_source(config_.input_path, source, err)) {
        return false;
    }
    previous_source_ = source;
    compile_and_write(source, "initial compile");
    return true;
}

void WatchSession::notify_change() {
    debounce_ = platform::Timer::one_shot(loop_, config_.debounce, [this]() {
        recompile();
    });
}

bool WatchSession::has_pending_change() const {
    return debounce_ && debounce_->is_active();
}

bool WatchSession::recompile() {
    std::string source;
    std::string err;
    if (!io::read_source(config_.input_path, source, err)) {
        diagnostics_.error(kModule, "watch", err);
        return false;
    }
    if (source == previous_source_) {
        ++skipped_count_;
        return false;
    }
    compile_and_write(source, "watch");
    if (!last_compile_ok_) {
        return false;
    }
    previous_source_ = std::move(source);
    return true;
}

}  // namespace boa::cli
