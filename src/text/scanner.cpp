#include <boa/text/scanner.h>

#include <cctype>

namespace boa::text {

std::size_t find_top_level_colon(std::string_view text) {
    return scan_top_level(text, ScanOptions{}, [&](std::size_t i) {
        return text[i] == ':';
    });
}

std::vector<std::string> split_top_level_commas(std::string_view text) {
    std::vector<std::string> parts;
    std::size_t segment_start = 0;

    scan_top_level(text, ScanOptions{}, [&](std::size_t i) {
        if (text[i] == ',') {
            parts.emplace_back(text.substr(segment_start, i - segment_start));
            segment_start = i + 1;
        }
        return false;
    });

    std::string_view rest = text.substr(segment_start);
    if (!trim(rest).empty()) {
        parts.emplace_back(rest);
    }
    return parts;
}

std::size_t find_comment_start(std::string_view text) {
    ScanOptions options;
    options.honor_escapes = true;
    options.track_nesting = false;
    return scan_top_level(text, options, [&](std::size_t i) {
        if (text[i] != '/' || i + 1 >= text.size()) return false;
        char next = text[i + 1];
        return next == '/' || next == '*';
    });
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim_start(std::string_view text) {
    std::size_t start = 0;
    while (start < text.size() && is_space(text[start])) ++start;
    return text.substr(start);
}

std::string_view trim_end(std::string_view text) {
    std::size_t end = text.size();
    while (end > 0 && is_space(text[end - 1])) --end;
    return text.substr(0, end);
}

std::string_view trim(std::string_view text) {
    return trim_end(trim_start(text));
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

} // namespace boa::text
