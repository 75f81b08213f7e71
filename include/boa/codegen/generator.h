#pragma once
#include <boa/parser/ast.h>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace boa::codegen {

struct GeneratorOptions {
    std::string indent = "  ";
    std::string root_selector = ":root";
    bool compact = false;
    bool hover_guard = true;
};

// Emits CSS for one stylesheet tree. Holds the per-call state: output lines,
// deferred root variables and the constant scope stack. Construct one per
// compile call.
class Generator {
public:
    explicit Generator(GeneratorOptions options);

    std::string generate(const parser::Stylesheet& sheet);

    // Replaces $name references: innermost constant literal if one is in
    // scope, var(--name) otherwise.
    std::string substitute(std::string_view value) const;

    void push_scope();
    void pop_scope();
    void define_constant(const std::string& name, std::string value);
    std::optional<std::string> lookup_constant(const std::string& name) const;

private:
    using SelectorStack = std::vector<std::string>;
    using ConstantScope = std::map<std::string, std::string>;

    struct EmitVisitor;

    void emit_nodes(const std::vector<parser::Node>& nodes, int depth,
                    const SelectorStack& selectors);
    void emit_declaration(const parser::Declaration& node, int depth);
    void emit_variable(const parser::Variable& node, int depth, const SelectorStack& selectors);
    void emit_rule(const parser::Rule& node, int depth, const SelectorStack& selectors,
                   bool inside_hover_guard = false);
    void emit_at_rule(const parser::AtRule& node, int depth, const SelectorStack& selectors);
    void emit_comment(const parser::CommentNode& node, int depth);

    std::string indent_for(int depth) const;
    std::string trailing_comment(const std::optional<parser::Comment>& comment) const;
    const char* open_brace() const { return options_.compact ? "{" : " {"; }
    const char* property_separator() const { return options_.compact ? ":" : ": "; }

    GeneratorOptions options_;
    std::vector<std::string> lines_;
    std::vector<std::string> root_variables_;
    std::vector<ConstantScope> scopes_;
};

} // namespace boa::codegen
