#include <boa/cli/options.h>
#include <boa/cli/watch_session.h>
#include <boa/compiler.h>
#include <boa/core/config.h>
#include <boa/core/diagnostics.h>
#include <boa/io/source_io.h>
#include <boa/platform/event_loop.h>
#include <boa/platform/file_watcher.h>
#include <boa/platform/timer.h>

#include <csignal>
#include <iostream>
#include <string>

namespace {

constexpr const char kModule[] = "cli";

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int) {
  g_stop_requested = 1;
}

int compile_once(const boa::cli::CliOptions& options,
                 boa::core::DiagnosticEmitter& diagnostics) {
  std::string source;
  std::string err;
  if (!boa::io::read_source(options.input_path, source, err)) {
    diagnostics.error(kModule, "run", err);
    return 1;
  }

  const boa::CompileResult result = boa::try_compile(source, options.compile);
  if (!result.ok) {
    diagnostics.error(kModule, "run", result.error->what());
    return 1;
  }

  if (!boa::io::write_output(result.css, options.output_path, err)) {
    diagnostics.error(kModule, "run", err);
    return 1;
  }
  return 0;
}

int watch(const boa::cli::CliOptions& options,
          boa::core::DiagnosticEmitter& diagnostics) {
  if (boa::io::is_stdio_path(options.input_path)) {
    diagnostics.error(kModule, "run", "Watch mode requires a real input file path.");
    return 1;
  }

  boa::platform::EventLoop loop;

  boa::cli::WatchConfig config;
  config.input_path = options.input_path;
  config.output_path = options.output_path;
  config.compile = options.compile;
  boa::cli::WatchSession session(loop, config, diagnostics);

  std::string err;
  if (!session.compile_initial(err)) {
    diagnostics.error(kModule, "run", err);
    return 1;
  }

  boa::platform::FileWatcher watcher(loop, options.input_path);
  watcher.start([&session]() { session.notify_change(); });

  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);
  auto stop_check = boa::platform::Timer::repeating(
      loop, boa::core::config::kWatchPollInterval, [&loop]() {
        if (g_stop_requested != 0) {
          loop.quit();
        }
      });

  diagnostics.info(kModule, "watching " + options.input_path + "... (Ctrl+C to exit)");
  loop.run();

  watcher.stop();
  stop_check->cancel();
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  const boa::cli::ParseArgsResult parsed = boa::cli::parse_arguments(argc, argv);
  if (!parsed.ok) {
    std::cerr << parsed.error << "\n";
    boa::cli::print_usage(std::cerr);
    return 1;
  }

  const boa::cli::CliOptions& options = parsed.options;
  if (options.show_help) {
    boa::cli::print_usage(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << boa::core::config::kVersionString << "\n";
    return 0;
  }
  // Progress goes to stdout unless stdout carries the compiled CSS.
  boa::core::DiagnosticEmitter diagnostics;
  std::ostream& progress = boa::io::is_stdio_path(options.output_path) ? std::cerr : std::cout;
  diagnostics.add_observer(boa::core::console_observer(progress, std::cerr));
  if (options.quiet) {
    diagnostics.set_min_severity(boa::core::Severity::Error);
  }

  if (options.watch) {
    return watch(options, diagnostics);
  }
  return compile_once(options, diagnostics);
}
