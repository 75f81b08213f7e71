#include <boa/codegen/generator.h>
#include <boa/codegen/compact.h>
#include <boa/codegen/selector.h>
#include <boa/text/scanner.h>

#include <utility>
#include <variant>

namespace boa::codegen {

using parser::AtRule;
using parser::CommentNode;
using parser::Declaration;
using parser::Node;
using parser::Rule;
using parser::Variable;

// Dispatches each node kind to its emitter. Adding a node kind without an
// overload here fails to compile.
struct Generator::EmitVisitor {
    Generator& gen;
    int depth;
    const SelectorStack& selectors;

    void operator()(const Declaration& node) const { gen.emit_declaration(node, depth); }
    void operator()(const Variable& node) const { gen.emit_variable(node, depth, selectors); }
    void operator()(const Rule& node) const { gen.emit_rule(node, depth, selectors); }
    void operator()(const AtRule& node) const { gen.emit_at_rule(node, depth, selectors); }
    void operator()(const CommentNode& node) const { gen.emit_comment(node, depth); }
};

Generator::Generator(GeneratorOptions options)
    : options_(std::move(options)) {
    scopes_.emplace_back();
}

std::string Generator::generate(const parser::Stylesheet& sheet) {
    emit_nodes(sheet, 0, SelectorStack{});

    std::vector<std::string> chunks;
    if (!root_variables_.empty()) {
        if (options_.compact) {
            std::string block = options_.root_selector + "{";
            for (const auto& line : root_variables_) block += line;
            block += "}";
            chunks.push_back(std::move(block));
        } else {
            chunks.push_back(options_.root_selector + " {");
            for (const auto& line : root_variables_) {
                chunks.push_back(options_.indent + line);
            }
            chunks.push_back("}");
            if (!lines_.empty()) chunks.emplace_back();
        }
    }
    chunks.insert(chunks.end(), lines_.begin(), lines_.end());

    std::string out;
    if (options_.compact) {
        for (const auto& chunk : chunks) out += chunk;
        return out;
    }
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        if (i > 0) out += '\n';
        out += chunks[i];
    }
    out += '\n';
    return out;
}

void Generator::emit_nodes(const std::vector<Node>& nodes, int depth,
                           const SelectorStack& selectors) {
    for (const auto& node : nodes) {
        std::visit(EmitVisitor{*this, depth, selectors}, node.value);
    }
}

void Generator::emit_declaration(const Declaration& node, int depth) {
    std::string value = substitute(node.value);
    if (options_.compact) value = compact_value(value);

    std::string line = indent_for(depth) + node.property + property_separator() + value + ";";
    line += trailing_comment(node.comment);
    lines_.push_back(std::move(line));
}

void Generator::emit_variable(const Variable& node, int depth, const SelectorStack& selectors) {
    std::string value = substitute(node.value);
    if (options_.compact) value = compact_value(value);

    if (node.is_constant) {
        define_constant(node.name, std::move(value));
        return;
    }

    std::string line = "--" + node.name + property_separator() + value + ";";
    line += trailing_comment(node.comment);

    if (selectors.empty() && depth == 0) {
        root_variables_.push_back(std::move(line));
    } else {
        lines_.push_back(indent_for(depth) + line);
    }
}

void Generator::emit_rule(const Rule& node, int depth, const SelectorStack& selectors,
                          bool inside_hover_guard) {
    std::string selector = normalize_selector(node.selector, !selectors.empty(), options_.compact);
    std::string indent = indent_for(depth);

    if (options_.hover_guard && !inside_hover_guard && contains_hover(selector)) {
        lines_.push_back(indent + (options_.compact ? "@media(hover:hover){"
                                                    : "@media (hover: hover) {"));
        emit_rule(node, depth + 1, selectors, true);
        lines_.push_back(indent + "}");
        return;
    }

    std::string line = indent + selector + trailing_comment(node.comment) + open_brace();
    lines_.push_back(std::move(line));

    SelectorStack nested = selectors;
    nested.push_back(selector);
    push_scope();
    emit_nodes(node.children, depth + 1, nested);
    pop_scope();
    lines_.push_back(indent + "}");
}

void Generator::emit_at_rule(const AtRule& node, int depth, const SelectorStack& selectors) {
    std::string indent = indent_for(depth);

    std::string heading = "@" + node.name;
    if (!node.params.empty()) {
        std::string params = substitute(node.params);
        if (options_.compact) {
            params = compact_at_rule_params(params);
            if (!params.empty() && params.front() != '(') heading += ' ';
            heading += params;
        } else {
            heading += " " + params;
        }
    }
    heading += trailing_comment(node.comment);

    if (node.children.empty()) {
        lines_.push_back(indent + heading + ";");
        return;
    }

    lines_.push_back(indent + heading + open_brace());
    push_scope();
    emit_nodes(node.children, depth + 1, selectors);
    pop_scope();
    lines_.push_back(indent + "}");
}

void Generator::emit_comment(const CommentNode& node, int depth) {
    if (options_.compact) return;
    lines_.push_back(indent_for(depth) + parser::render_comment(node.comment));
}

std::string Generator::substitute(std::string_view value) const {
    std::string out;
    out.reserve(value.size());

    std::size_t i = 0;
    while (i < value.size()) {
        if (value[i] != '$') {
            out.push_back(value[i++]);
            continue;
        }
        std::size_t name_end = i + 1;
        while (name_end < value.size() && text::is_ident_char(value[name_end])) ++name_end;
        if (name_end == i + 1) {
            out.push_back(value[i++]);
            continue;
        }

        std::string name(value.substr(i + 1, name_end - i - 1));
        if (auto constant = lookup_constant(name)) {
            out += *constant;
        } else {
            out += "var(--" + name + ")";
        }
        i = name_end;
    }
    return out;
}

void Generator::push_scope() {
    scopes_.emplace_back();
}

void Generator::pop_scope() {
    if (scopes_.size() > 1) scopes_.pop_back();
}

void Generator::define_constant(const std::string& name, std::string value) {
    // First definition in a scope wins.
    scopes_.back().emplace(name, std::move(value));
}

std::optional<std::string> Generator::lookup_constant(const std::string& name) const {
    for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
        auto found = it->find(name);
        if (found != it->end()) return found->second;
    }
    return std::nullopt;
}

std::string Generator::indent_for(int depth) const {
    if (options_.compact) return {};
    std::string out;
    for (int i = 0; i < depth; ++i) out += options_.indent;
    return out;
}

std::string Generator::trailing_comment(const std::optional<parser::Comment>& comment) const {
    if (options_.compact || !comment) return {};
    return " " + parser::render_comment(*comment);
}

} // namespace boa::codegen
