#pragma once
#include <string>
#include <string_view>

namespace boa::codegen {

// Replaces every whole `:hocus` pseudo token with :is(:hover, :focus-within).
std::string expand_pseudo_aliases(std::string_view selector);

// Rewrites a selector list for native nesting. Nested parts without a parent
// reference get `&` (directly before :, :: and [, otherwise followed by a
// space); top-level selectors are never prefixed.
std::string normalize_selector(std::string_view selector, bool has_parent, bool compact);

// True when the selector targets the hover state.
bool contains_hover(std::string_view selector);

} // namespace boa::codegen
