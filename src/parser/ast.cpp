#include <boa/parser/ast.h>

#include <sstream>

namespace boa::parser {

std::vector<Node>* children_of(Node& node) {
    if (auto* rule = std::get_if<Rule>(&node.value)) return &rule->children;
    if (auto* at_rule = std::get_if<AtRule>(&node.value)) return &at_rule->children;
    return nullptr;
}

const std::vector<Node>* children_of(const Node& node) {
    if (auto* rule = std::get_if<Rule>(&node.value)) return &rule->children;
    if (auto* at_rule = std::get_if<AtRule>(&node.value)) return &at_rule->children;
    return nullptr;
}

namespace {

struct DumpVisitor {
    std::ostringstream& out;
    int depth;

    void pad() const {
        for (int i = 0; i < depth; ++i) out << "  ";
    }

    void operator()(const Variable& v) const {
        pad();
        out << "variable " << v.name << " = " << v.value;
        if (v.is_constant) out << " (const)";
        out << "\n";
    }

    void operator()(const Declaration& d) const {
        pad();
        out << "declaration " << d.property << " = " << d.value << "\n";
    }

    void operator()(const Rule& r) const {
        pad();
        out << "rule " << r.selector << "\n";
        dump_children(r.children);
    }

    void operator()(const AtRule& a) const {
        pad();
        out << "at-rule @" << a.name;
        if (!a.params.empty()) out << " " << a.params;
        out << "\n";
        dump_children(a.children);
    }

    void operator()(const CommentNode& c) const {
        pad();
        out << "comment " << c.comment.text << "\n";
    }

    void dump_children(const std::vector<Node>& children) const {
        for (const auto& child : children) {
            std::visit(DumpVisitor{out, depth + 1}, child.value);
        }
    }
};

} // namespace

std::string dump(const Stylesheet& sheet) {
    std::ostringstream out;
    for (const auto& node : sheet) {
        std::visit(DumpVisitor{out, 0}, node.value);
    }
    return out.str();
}

} // namespace boa::parser
