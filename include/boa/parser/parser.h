#pragma once
#include <boa/parser/ast.h>
#include <boa/parser/indentation.h>
#include <boa/text/source_text.h>

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace boa::parser {

// Builds the statement tree of one source text. A parser is single-use:
// construct it per compile call and discard it afterwards.
class Parser {
public:
    // In compact mode comments are stripped before parsing and never reach
    // the tree.
    explicit Parser(std::string_view source, bool compact = false);

    // Throws CompileError on the first indentation or statement fault.
    Stylesheet parse();

    // Classifies one logical line. Returns nothing for a line that holds
    // only a comment in compact mode.
    std::optional<Node> parse_line(std::string_view content, std::size_t offset) const;

private:
    struct IndentContext {
        std::size_t indent = 0;
        std::vector<Node>* nodes = nullptr;
        Node* last = nullptr;
    };

    std::string merge_continuations(std::size_t& line_index, std::size_t indent);

    text::SourceText source_;
    IndentationAnalyzer indentation_;
    bool compact_;
};

Stylesheet parse_stylesheet(std::string_view source, bool compact = false);

} // namespace boa::parser
