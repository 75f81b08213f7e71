#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace boa {

enum class ErrorCode {
    // Indentation faults
    MixedIndentation,
    InvalidIndentStep,
    UnexpectedIndent,
    UnbalancedIndent,
    // Statement faults
    EmptyName,
    EmptyProperty,
    EmptyValue,
    MalformedVariable,
};

const char* error_code_name(ErrorCode code);

// The single failure kind of a compile call. what() reads
// "<message> (at <offset>)"; offset is a byte position in the source text.
class CompileError : public std::runtime_error {
public:
    CompileError(ErrorCode code, std::string message, std::size_t offset);

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::size_t offset() const { return offset_; }

private:
    ErrorCode code_;
    std::string message_;
    std::size_t offset_;
};

} // namespace boa
