#include <boa/codegen/compact.h>
#include <boa/text/scanner.h>

namespace boa::codegen {

namespace {

std::string drop_space_after(std::string_view input, char marker) {
    std::string out;
    out.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        char c = input[i++];
        out.push_back(c);
        if (c == marker) {
            while (i < input.size() && text::is_space(input[i])) ++i;
        }
    }
    return out;
}

std::string drop_space_before(std::string_view input, char marker) {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        if (c == marker) {
            while (!out.empty() && text::is_space(out.back())) out.pop_back();
        }
        out.push_back(c);
    }
    return out;
}

std::string collapse_whitespace_runs(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        if (!text::is_space(input[i])) {
            out.push_back(input[i++]);
            continue;
        }
        std::size_t run_end = i;
        while (run_end < input.size() && text::is_space(input[run_end])) ++run_end;
        if (run_end - i >= 2) {
            out.push_back(' ');
        } else {
            out.push_back(input[i]);
        }
        i = run_end;
    }
    return out;
}

std::string tighten_punctuation(std::string_view input) {
    std::string out = drop_space_after(input, ',');
    out = drop_space_after(out, '(');
    out = drop_space_before(out, ')');
    out = drop_space_after(out, ')');
    return out;
}

} // namespace

std::string compact_value(std::string_view value) {
    std::string out = tighten_punctuation(value);
    out = collapse_whitespace_runs(out);
    return std::string(text::trim(out));
}

std::string compact_at_rule_params(std::string_view params) {
    std::string out = tighten_punctuation(params);
    out = drop_space_before(out, ':');
    out = drop_space_after(out, ':');
    out = collapse_whitespace_runs(out);
    return std::string(text::trim(out));
}

} // namespace boa::codegen
