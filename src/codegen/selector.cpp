#include <boa/codegen/selector.h>
#include <boa/text/scanner.h>

#include <vector>

namespace boa::codegen {

namespace {

constexpr std::string_view kHocus = ":hocus";
constexpr std::string_view kHocusExpansion = ":is(:hover, :focus-within)";

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string result;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

std::string nest_part(std::string_view raw_part) {
    std::string part = expand_pseudo_aliases(text::trim(raw_part));
    if (part.empty()) return part;
    if (part.find('&') != std::string::npos || part.front() == '@') return part;
    if (part.front() == ':' || part.front() == '[') return "&" + part;
    return "& " + part;
}

} // namespace

std::string expand_pseudo_aliases(std::string_view selector) {
    std::string result;
    result.reserve(selector.size());

    std::size_t pos = 0;
    while (pos < selector.size()) {
        std::size_t found = selector.find(kHocus, pos);
        if (found == std::string_view::npos) break;

        std::size_t after = found + kHocus.size();
        result.append(selector.substr(pos, found - pos));
        if (after < selector.size() && text::is_ident_char(selector[after])) {
            result.append(kHocus);
        } else {
            result.append(kHocusExpansion);
        }
        pos = after;
    }
    result.append(selector.substr(pos));
    return result;
}

std::string normalize_selector(std::string_view selector, bool has_parent, bool compact) {
    std::string expanded = expand_pseudo_aliases(text::trim(selector));

    if (!has_parent) {
        if (!compact) return expanded;
        std::vector<std::string> parts = text::split_top_level_commas(expanded);
        if (parts.size() <= 1) return expanded;
        for (auto& part : parts) {
            part = std::string(text::trim(part));
        }
        return join(parts, ",");
    }

    std::vector<std::string> parts = text::split_top_level_commas(expanded);
    for (auto& part : parts) {
        part = nest_part(part);
    }
    return join(parts, compact ? "," : ", ");
}

bool contains_hover(std::string_view selector) {
    return selector.find(":hover") != std::string_view::npos;
}

} // namespace boa::codegen
