#pragma once
#include <cstddef>
#include <optional>
#include <string_view>

namespace boa::parser {

enum class IndentStyle { Space, Tab };

struct IndentMeasure {
    std::size_t columns = 0;
    std::optional<IndentStyle> style;  // unset when the line has no indent
};

// Tracks the file-wide indentation style and step. Both are learned once
// and never change afterwards; every violation throws CompileError.
class IndentationAnalyzer {
public:
    // Measures the leading spaces/tabs of `line`. A tab counts as one step
    // once the step is known, kTabColumns before that.
    IndentMeasure measure(std::string_view line, std::size_t offset) const;

    // measure() plus style learning and the multiple-of-step check.
    IndentMeasure classify(std::string_view line, std::size_t offset);

    // Records the style of an indented line, or rejects the other style.
    void observe_style(const IndentMeasure& measure, std::size_t offset);

    void learn_step(std::size_t step) { step_ = step; }
    std::optional<std::size_t> step() const { return step_; }
    std::optional<IndentStyle> style() const { return style_; }

private:
    std::optional<std::size_t> step_;
    std::optional<IndentStyle> style_;
};

} // namespace boa::parser
