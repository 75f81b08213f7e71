#pragma once
#include <boa/parser/comment.h>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace boa::parser {

struct Node;

// $name: value [!const]
struct Variable {
    std::string name;
    std::string value;
    bool is_constant = false;
    std::optional<Comment> comment;
};

// property: value
struct Declaration {
    std::string property;
    std::string value;
    std::optional<Comment> comment;
};

struct Rule {
    std::string selector;
    std::vector<Node> children;
    std::optional<Comment> comment;
};

// @name params, with a block when children exist
struct AtRule {
    std::string name;
    std::string params;
    std::vector<Node> children;
    std::optional<Comment> comment;
};

// A comment on a line of its own.
struct CommentNode {
    Comment comment;
};

struct Node {
    std::variant<Variable, Declaration, Rule, AtRule, CommentNode> value;
};

using Stylesheet = std::vector<Node>;

// Only rules and at-rules own children; returns nullptr for leaves.
std::vector<Node>* children_of(Node& node);
const std::vector<Node>* children_of(const Node& node);

// Debug rendering of the tree, one node per line.
std::string dump(const Stylesheet& sheet);

} // namespace boa::parser
