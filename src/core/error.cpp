#include <boa/core/error.h>

#include <utility>

namespace boa {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::MixedIndentation:  return "MixedIndentation";
        case ErrorCode::InvalidIndentStep: return "InvalidIndentStep";
        case ErrorCode::UnexpectedIndent:  return "UnexpectedIndent";
        case ErrorCode::UnbalancedIndent:  return "UnbalancedIndent";
        case ErrorCode::EmptyName:         return "EmptyName";
        case ErrorCode::EmptyProperty:     return "EmptyProperty";
        case ErrorCode::EmptyValue:        return "EmptyValue";
        case ErrorCode::MalformedVariable: return "MalformedVariable";
    }
    return "Unknown";
}

CompileError::CompileError(ErrorCode code, std::string message, std::size_t offset)
    : std::runtime_error(message + " (at " + std::to_string(offset) + ")")
    , code_(code)
    , message_(std::move(message))
    , offset_(offset) {}

} // namespace boa
