#include <boa/parser/indentation.h>
#include <boa/core/config.h>
#include <boa/core/error.h>

namespace boa::parser {

namespace {

void throw_mixed(std::size_t offset) {
    throw CompileError(ErrorCode::MixedIndentation,
                       "Indentation mixes tabs and spaces", offset);
}

} // namespace

IndentMeasure IndentationAnalyzer::measure(std::string_view line, std::size_t offset) const {
    IndentMeasure result;
    for (char ch : line) {
        IndentStyle current;
        if (ch == ' ') {
            current = IndentStyle::Space;
        } else if (ch == '\t') {
            current = IndentStyle::Tab;
        } else {
            break;
        }

        if (style_ && *style_ != current) throw_mixed(offset);
        if (result.style && *result.style != current) throw_mixed(offset);
        result.style = current;

        if (current == IndentStyle::Space) {
            result.columns += 1;
        } else {
            result.columns += step_.value_or(core::config::kTabColumns);
        }
    }
    return result;
}

void IndentationAnalyzer::observe_style(const IndentMeasure& measure, std::size_t offset) {
    if (!measure.style || measure.columns == 0) return;
    if (!style_) {
        style_ = measure.style;
    } else if (*style_ != *measure.style) {
        throw_mixed(offset);
    }
}

IndentMeasure IndentationAnalyzer::classify(std::string_view line, std::size_t offset) {
    IndentMeasure result = measure(line, offset);
    observe_style(result, offset);

    if (step_ && result.columns > 0 && result.columns % *step_ != 0) {
        throw CompileError(ErrorCode::InvalidIndentStep,
                           "Indentation is not a multiple of the base indent", offset);
    }
    return result;
}

} // namespace boa::parser
