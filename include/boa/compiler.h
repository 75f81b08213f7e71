#pragma once
#include <boa/core/config.h>
#include <boa/core/error.h>

#include <optional>
#include <string>
#include <string_view>

namespace boa {

struct CompileOptions {
    std::string indent = core::config::kDefaultIndent;
    std::string root_selector = core::config::kDefaultRootSelector;
    bool compact = false;
    bool hover_guard = true;
};

struct CompileResult {
    bool ok = false;
    std::string css;
    std::optional<CompileError> error;
};

// Compiles one complete source text. Throws CompileError on the first fault;
// no partial output is produced. Safe to call concurrently: every call owns
// its parser and generator.
std::string compile(std::string_view source, const CompileOptions& options = {});

// compile() reporting faults through the result instead of throwing.
CompileResult try_compile(std::string_view source, const CompileOptions& options = {});

} // namespace boa
