#include <boa/io/source_io.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace boa::io {

bool is_stdio_path(const std::string& path) {
    return path.empty() || path == "-";
}

bool read_source(const std::string& path, std::string& out_text, std::string& err) {
    std::ostringstream stream;

    if (is_stdio_path(path)) {
        stream << std::cin.rdbuf();
        if (std::cin.bad()) {
            err = "Failed to read standard input";
            return false;
        }
        out_text = stream.str();
        return true;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        err = "Input file not found: " + path;
        return false;
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        err = "Unable to open file: " + path;
        return false;
    }

    stream << file.rdbuf();
    if (!file.good() && !file.eof()) {
        err = "Failed to read file: " + path;
        return false;
    }

    out_text = stream.str();
    return true;
}

bool write_output(const std::string& text, const std::string& path, std::string& err) {
    if (is_stdio_path(path)) {
        std::cout << text;
        std::cout.flush();
        if (!std::cout.good()) {
            err = "Failed to write standard output";
            return false;
        }
        return true;
    }

    std::ofstream output(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        err = "Unable to open output file: " + path;
        return false;
    }

    output.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!output.good()) {
        err = "Failed to write file: " + path;
        return false;
    }
    return true;
}

}  // namespace boa::io
