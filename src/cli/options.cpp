#include <boa/cli/options.h>
#include <boa/core/config.h>

#include <charconv>
#include <ostream>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace boa::cli {

namespace {

bool parse_positive_int(std::string_view text, int& value) {
    if (text.empty()) {
        return false;
    }

    int parsed = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    const std::from_chars_result result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc() || result.ptr != end || parsed <= 0) {
        return false;
    }

    value = parsed;
    return true;
}

bool parse_indent_flag(std::string_view value, std::string& indent) {
    if (value == "tab") {
        indent = "\t";
        return true;
    }
    int width = 0;
    if (!parse_positive_int(value, width)) {
        return false;
    }
    indent.assign(static_cast<std::size_t>(width), ' ');
    return true;
}

ParseArgsResult fail(std::string message) {
    ParseArgsResult result;
    result.error = std::move(message);
    return result;
}

}  // namespace

void print_usage(std::ostream& stream) {
    stream << "usage: " << core::config::kProgramName
           << " [options] [input] [output]\n"
           << "  input/output default to stdin/stdout ('-' also selects them)\n"
           << "  -m, --minify, --compact  compact output\n"
           << "  --no-hover-guard         do not wrap :hover rules in @media (hover: hover)\n"
           << "  -w, --watch              recompile whenever the input file changes\n"
           << "  --indent=N|tab           output indentation (default 2 spaces)\n"
           << "  --root=SELECTOR          selector for root variables (default :root)\n"
           << "  -q, --quiet              only report errors\n"
           << "  -h, --help               show this help\n"
           << "  -V, --version            show the version\n";
}

ParseArgsResult parse_arguments(int argc, const char* const* argv) {
    ParseArgsResult result;
    CliOptions& options = result.options;
    std::vector<std::string_view> positional_args;

    constexpr std::string_view kIndentPrefix = "--indent=";
    constexpr std::string_view kRootPrefix = "--root=";

    for (int index = 1; index < argc; ++index) {
        const std::string_view argument(argv[index] != nullptr ? argv[index] : "");

        if (argument == "-h" || argument == "--help") {
            options.show_help = true;
        } else if (argument == "-V" || argument == "--version") {
            options.show_version = true;
        } else if (argument == "-m" || argument == "--minify" || argument == "--compact") {
            options.compile.compact = true;
        } else if (argument == "--no-hover-guard") {
            options.compile.hover_guard = false;
        } else if (argument == "-w" || argument == "--watch") {
            options.watch = true;
        } else if (argument == "-q" || argument == "--quiet") {
            options.quiet = true;
        } else if (argument.starts_with(kIndentPrefix)) {
            if (!parse_indent_flag(argument.substr(kIndentPrefix.size()), options.compile.indent)) {
                return fail("Invalid --indent: '" + std::string(argument) +
                            "' (expected a positive integer or 'tab')");
            }
        } else if (argument.starts_with(kRootPrefix)) {
            std::string_view selector = argument.substr(kRootPrefix.size());
            if (selector.empty()) {
                return fail("Invalid --root: selector must not be empty");
            }
            options.compile.root_selector = std::string(selector);
        } else if (argument.size() > 1 && argument.front() == '-' && argument != "-") {
            return fail("Unknown option: " + std::string(argument));
        } else {
            positional_args.push_back(argument);
        }
    }

    if (positional_args.size() > 2) {
        return fail("Too many arguments");
    }
    if (!positional_args.empty()) {
        options.input_path = std::string(positional_args[0]);
    }
    if (positional_args.size() >= 2) {
        options.output_path = std::string(positional_args[1]);
    }

    result.ok = true;
    return result;
}

}  // namespace boa::cli
