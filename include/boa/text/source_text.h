#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace boa::text {

// One physical line without its terminator. `offset` is the byte position of
// the line's first character in the caller's original source.
struct PhysicalLine {
    std::string text;
    std::size_t offset = 0;
};

// Prepared view of a source text. Lines break on LF, CRLF and lone CR.
// When comments are stripped (compact mode) the remaining characters keep
// their original offsets, so errors always point into the caller's text.
class SourceText {
public:
    static SourceText prepare(std::string_view source, bool strip_comments);

    const std::vector<PhysicalLine>& lines() const { return lines_; }
    std::size_t size() const { return lines_.size(); }
    const PhysicalLine& operator[](std::size_t index) const { return lines_[index]; }

private:
    std::vector<PhysicalLine> lines_;
};

// Removes every terminated /* */ span, then every // comment that starts a
// line or follows whitespace. The whitespace before a // is kept.
std::string strip_comments(std::string_view source);

} // namespace boa::text
