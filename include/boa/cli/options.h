#pragma once

#include <boa/compiler.h>

#include <iosfwd>
#include <string>

namespace boa::cli {

struct CliOptions {
    std::string input_path;   // empty or "-" reads standard input
    std::string output_path;  // empty or "-" writes standard output
    bool watch = false;
    bool quiet = false;
    bool show_help = false;
    bool show_version = false;
    CompileOptions compile;
};

struct ParseArgsResult {
    bool ok = false;
    CliOptions options;
    std::string error;
};

ParseArgsResult parse_arguments(int argc, const char* const* argv);

void print_usage(std::ostream& stream);

}  // namespace boa::cli
