#include <boa/text/source_text.h>
#include <boa/text/scanner.h>

namespace boa::text {

namespace {

// Characters of a prepared text paired with the offset each one had in the
// original source.
struct MappedText {
    std::string chars;
    std::vector<std::size_t> origin;

    void push(char c, std::size_t at) {
        chars.push_back(c);
        origin.push_back(at);
    }
};

MappedText identity(std::string_view source) {
    MappedText out;
    out.chars.assign(source.begin(), source.end());
    out.origin.reserve(source.size());
    for (std::size_t i = 0; i < source.size(); ++i) {
        out.origin.push_back(i);
    }
    return out;
}

MappedText strip_block_comments(const MappedText& in) {
    MappedText out;
    const std::string& s = in.chars;
    std::size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '/' && i + 1 < s.size() && s[i + 1] == '*') {
            std::size_t end = s.find("*/", i + 2);
            if (end != std::string::npos) {
                i = end + 2;
                continue;
            }
        }
        out.push(s[i], in.origin[i]);
        ++i;
    }
    return out;
}

bool is_line_break(char c) {
    return c == '\n' || c == '\r';
}

MappedText strip_line_comments(const MappedText& in) {
    MappedText out;
    const std::string& s = in.chars;
    std::size_t i = 0;
    while (i < s.size()) {
        bool opens = s[i] == '/' && i + 1 < s.size() && s[i + 1] == '/' &&
                     (i == 0 || is_space(s[i - 1]));
        if (opens) {
            while (i < s.size() && !is_line_break(s[i])) ++i;
            continue;
        }
        out.push(s[i], in.origin[i]);
        ++i;
    }
    return out;
}

MappedText strip_mapped(std::string_view source) {
    return strip_line_comments(strip_block_comments(identity(source)));
}

} // namespace

std::string strip_comments(std::string_view source) {
    return strip_mapped(source).chars;
}

SourceText SourceText::prepare(std::string_view source, bool strip) {
    MappedText mapped = strip ? strip_mapped(source) : identity(source);
    const std::string& s = mapped.chars;

    auto origin_of = [&](std::size_t index) {
        return index < mapped.origin.size() ? mapped.origin[index] : source.size();
    };

    SourceText result;
    std::size_t start = 0;
    std::size_t i = 0;
    while (i <= s.size()) {
        if (i == s.size() || is_line_break(s[i])) {
            result.lines_.push_back(PhysicalLine{s.substr(start, i - start), origin_of(start)});
            if (i == s.size()) break;
            if (s[i] == '\r' && i + 1 < s.size() && s[i + 1] == '\n') ++i;
            ++i;
            start = i;
            continue;
        }
        ++i;
    }
    return result;
}

} // namespace boa::text
