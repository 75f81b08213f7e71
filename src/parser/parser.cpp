#include <boa/parser/parser.h>
#include <boa/core/error.h>
#include <boa/text/scanner.h>

#include <string>
#include <utility>

namespace boa::parser {

namespace {

bool can_nest(const Node* node) {
    if (node == nullptr) return false;
    return std::holds_alternative<Rule>(node->value) ||
           std::holds_alternative<AtRule>(node->value);
}

// A declaration colon is followed directly by a space or tab.
bool is_declaration_colon(std::string_view content, std::size_t colon) {
    if (colon + 1 >= content.size()) return false;
    char next = content[colon + 1];
    return next == ' ' || next == '\t';
}

Node parse_variable(std::string_view content, std::size_t offset,
                    std::optional<Comment> comment) {
    std::size_t colon = content.find(':');
    if (colon == std::string_view::npos) {
        throw CompileError(ErrorCode::MalformedVariable,
                           "Expected \":\" after variable name", offset);
    }

    Variable variable;
    variable.name = std::string(text::trim(content.substr(1, colon - 1)));
    if (variable.name.empty()) {
        throw CompileError(ErrorCode::EmptyName, "Variable name cannot be empty", offset);
    }

    std::string_view value = text::trim(content.substr(colon + 1));
    constexpr std::string_view kConstMarker = "!const";
    if (value.ends_with(kConstMarker)) {
        variable.is_constant = true;
        value = text::trim(value.substr(0, value.size() - kConstMarker.size()));
    }
    variable.value = std::string(value);
    variable.comment = std::move(comment);
    return Node{std::move(variable)};
}

Node parse_at_rule(std::string_view content, std::optional<Comment> comment) {
    std::string_view rest = text::trim(content.substr(1));
    std::size_t name_end = 0;
    while (name_end < rest.size() && text::is_ident_char(rest[name_end])) ++name_end;

    AtRule at_rule;
    if (name_end > 0) {
        at_rule.name = std::string(rest.substr(0, name_end));
        at_rule.params = std::string(text::trim(rest.substr(name_end)));
    }
    at_rule.comment = std::move(comment);
    return Node{std::move(at_rule)};
}

} // namespace

Parser::Parser(std::string_view source, bool compact)
    : source_(text::SourceText::prepare(source, compact))
    , compact_(compact) {}

std::optional<Node> Parser::parse_line(std::string_view content, std::size_t offset) const {
    std::string statement;
    std::optional<Comment> comment;
    if (compact_) {
        statement = std::string(text::trim(content));
    } else {
        ExtractedStatement extracted = extract_comment(content);
        statement = std::string(text::trim(extracted.statement));
        comment = std::move(extracted.comment);
    }

    if (statement.empty()) {
        if (!compact_ && comment) {
            return Node{CommentNode{std::move(*comment)}};
        }
        return std::nullopt;
    }

    std::string_view main = statement;

    if (main.front() == '$') {
        return parse_variable(main, offset, std::move(comment));
    }

    if (main.front() == '@') {
        return parse_at_rule(main, std::move(comment));
    }

    std::size_t colon = text::find_top_level_colon(main);
    if (colon != std::string_view::npos && is_declaration_colon(main, colon)) {
        Declaration declaration;
        declaration.property = std::string(text::trim(main.substr(0, colon)));
        declaration.value = std::string(text::trim(main.substr(colon + 1)));
        if (declaration.property.empty()) {
            throw CompileError(ErrorCode::EmptyProperty,
                               "Declaration missing property name", offset);
        }
        if (declaration.value.empty()) {
            throw CompileError(ErrorCode::EmptyValue, "Declaration missing value", offset);
        }
        declaration.comment = std::move(comment);
        return Node{std::move(declaration)};
    }

    Rule rule;
    rule.selector = statement;
    rule.comment = std::move(comment);
    return Node{std::move(rule)};
}

// Joins following lines at the same indent while the text ends with a comma.
// Advances line_index past every consumed line.
std::string Parser::merge_continuations(std::size_t& line_index, std::size_t indent) {
    std::string content(text::trim(source_[line_index].text));

    while (!content.empty() && content.back() == ',' && line_index + 1 < source_.size()) {
        const text::PhysicalLine& next = source_[line_index + 1];
        std::string_view next_trimmed = text::trim(next.text);
        if (next_trimmed.empty()) break;

        IndentMeasure measured = indentation_.measure(next.text, next.offset);
        if (measured.columns != indent) break;
        indentation_.observe_style(measured, next.offset);

        content.pop_back();
        content = std::string(text::trim_end(content));
        content += ", ";
        content += next_trimmed;
        ++line_index;
    }
    return content;
}

Stylesheet Parser::parse() {
    Stylesheet sheet;
    std::vector<IndentContext> stack;
    stack.push_back(IndentContext{0, &sheet, nullptr});

    for (std::size_t line_index = 0; line_index < source_.size(); ++line_index) {
        const text::PhysicalLine& line = source_[line_index];
        if (text::trim(line.text).empty()) continue;

        std::size_t offset = line.offset;
        IndentMeasure measured = indentation_.classify(line.text, offset);
        std::size_t indent = measured.columns;

        while (stack.size() > 1 && indent < stack.back().indent) {
            stack.pop_back();
        }

        IndentContext* current = &stack.back();
        if (indent > current->indent) {
            if (!can_nest(current->last)) {
                throw CompileError(ErrorCode::UnexpectedIndent, "Unexpected indentation", offset);
            }
            if (!indentation_.step()) {
                indentation_.learn_step(indent - current->indent);
            }
            if (indent != current->indent + *indentation_.step()) {
                throw CompileError(ErrorCode::InvalidIndentStep,
                                   "Indentation jump must increase by one level", offset);
            }
            std::vector<Node>* children = children_of(*current->last);
            stack.push_back(IndentContext{indent, children, nullptr});
            current = &stack.back();
        } else if (indent != current->indent) {
            throw CompileError(ErrorCode::UnbalancedIndent,
                               "Indented block not properly closed", offset);
        }

        std::string content = merge_continuations(line_index, indent);

        std::optional<Node> node = parse_line(content, offset);
        if (node) {
            current->nodes->push_back(std::move(*node));
            current->last = &current->nodes->back();
        }
    }

    return sheet;
}

Stylesheet parse_stylesheet(std::string_view source, bool compact) {
    Parser parser(source, compact);
    return parser.parse();
}

} // namespace boa::parser
