#pragma once
#include <string>
#include <string_view>

namespace boa::codegen {

// Collapses spacing in a declaration value for compact output: no space
// after commas, inside or after parentheses, single spaces elsewhere.
std::string compact_value(std::string_view value);

// compact_value() that also removes the spacing around colons, for at-rule
// parameters such as media features.
std::string compact_at_rule_params(std::string_view params);

} // namespace boa::codegen
