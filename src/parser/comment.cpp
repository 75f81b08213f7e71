#include <boa/parser/comment.h>
#include <boa/text/scanner.h>

#include <utility>

namespace boa::parser {

ExtractedStatement extract_comment(std::string_view content) {
    std::size_t start = text::find_comment_start(content);
    if (start == std::string_view::npos) {
        return ExtractedStatement{std::string(text::trim(content)), std::nullopt};
    }

    ExtractedStatement result;
    result.statement = std::string(text::trim_end(content.substr(0, start)));

    Comment comment;
    if (content[start + 1] == '/') {
        std::string_view raw = text::trim(content.substr(start));
        comment.kind = CommentKind::Line;
        comment.raw = std::string(raw);
        comment.text = std::string(text::trim(raw.substr(2)));
    } else {
        std::size_t end = content.find("*/", start + 2);
        std::string_view raw;
        std::string_view inner;
        if (end != std::string_view::npos) {
            raw = content.substr(start, end + 2 - start);
            inner = raw.substr(2, raw.size() - 4);
        } else {
            raw = content.substr(start);
            inner = raw.substr(2);
        }
        comment.kind = CommentKind::Block;
        comment.raw = std::string(text::trim(raw));
        comment.text = std::string(text::trim(inner));
    }
    result.comment = std::move(comment);
    return result;
}

std::string render_comment(const Comment& comment) {
    if (comment.kind == CommentKind::Block && comment.raw.rfind("/*", 0) == 0) {
        if (comment.raw.ends_with("*/")) {
            return comment.raw;
        }
        return comment.raw + " */";
    }

    if (comment.text.empty()) return "/* */";
    return "/* " + comment.text + " */";
}

} // namespace boa::parser
