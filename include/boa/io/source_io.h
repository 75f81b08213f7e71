#pragma once

#include <string>

namespace boa::io {

// An empty path or "-" selects the standard stream.
bool is_stdio_path(const std::string& path);

// Reads a whole source file, or standard input. On failure returns false and
// sets `err`; a missing file reports "Input file not found: <path>".
bool read_source(const std::string& path, std::string& out_text, std::string& err);

// Writes compiled output to a file (replacing it), or standard output.
bool write_output(const std::string& text, const std::string& path, std::string& err);

}  // namespace boa::io
