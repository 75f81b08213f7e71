#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace boa::text {

// How a scan treats quotes and nesting.
struct ScanOptions {
    // A quote preceded by a backslash does not open or close a string.
    bool honor_escapes = false;
    // Track ( ) and [ ] depth; only depth-0 characters are reported.
    bool track_nesting = true;
};

// Walks `text`, calling visit(index) for every character that sits outside
// quoted spans (and at nesting depth 0 when tracking). Quote characters and
// brackets are never reported. Returns the index at which visit returned
// true, or npos.
template <typename Visitor>
std::size_t scan_top_level(std::string_view text, const ScanOptions& options,
                           Visitor&& visit) {
    bool in_single = false;
    bool in_double = false;
    int depth_round = 0;
    int depth_square = 0;

    for (std::size_t i = 0; i < text.size(); ++i) {
        char ch = text[i];
        bool escaped = options.honor_escapes && i > 0 && text[i - 1] == '\\';

        if (ch == '\'' && !in_double && !escaped) {
            in_single = !in_single;
            continue;
        }
        if (ch == '"' && !in_single && !escaped) {
            in_double = !in_double;
            continue;
        }
        if (in_single || in_double) continue;

        if (options.track_nesting) {
            if (ch == '(') { ++depth_round; continue; }
            if (ch == ')') { if (depth_round > 0) --depth_round; continue; }
            if (ch == '[') { ++depth_square; continue; }
            if (ch == ']') { if (depth_square > 0) --depth_square; continue; }
            if (depth_round != 0 || depth_square != 0) continue;
        }

        if (visit(i)) return i;
    }
    return std::string_view::npos;
}

// Index of the first ':' outside quotes, parentheses and brackets.
std::size_t find_top_level_colon(std::string_view text);

// Splits on commas outside quotes, parentheses and brackets. Segments keep
// their surrounding whitespace; a trailing whitespace-only segment is dropped.
std::vector<std::string> split_top_level_commas(std::string_view text);

// Index of the first "//" or "/*" outside quoted spans (escape aware,
// brackets ignored), or npos.
std::size_t find_comment_start(std::string_view text);

// Whitespace helpers shared by the parser and generator.
bool is_space(char c);
std::string_view trim(std::string_view text);
std::string_view trim_start(std::string_view text);
std::string_view trim_end(std::string_view text);

// [A-Za-z0-9_-], the character class of variable names and at-rule names.
bool is_ident_char(char c);

} // namespace boa::text
