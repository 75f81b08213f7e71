#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace boa::parser {

enum class CommentKind { Line, Block };

struct Comment {
    CommentKind kind = CommentKind::Line;
    std::string text;  // inner text, trimmed
    std::string raw;   // marker-inclusive source text, trimmed
};

struct ExtractedStatement {
    std::string statement;           // text before the comment marker
    std::optional<Comment> comment;
};

// Splits a statement from its first // or /* comment outside quotes.
// Text after a terminated block comment is dropped.
ExtractedStatement extract_comment(std::string_view content);

// Renders a comment for CSS output. Block comments keep their original
// delimiters so decorative formatting survives.
std::string render_comment(const Comment& comment);

} // namespace boa::parser
