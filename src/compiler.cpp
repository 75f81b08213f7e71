#include <boa/compiler.h>
#include <boa/codegen/generator.h>
#include <boa/parser/parser.h>

#include <utility>

namespace boa {

std::string compile(std::string_view source, const CompileOptions& options) {
    parser::Parser parser(source, options.compact);
    parser::Stylesheet sheet = parser.parse();

    codegen::GeneratorOptions generator_options;
    generator_options.indent = options.indent;
    generator_options.root_selector = options.root_selector;
    generator_options.compact = options.compact;
    generator_options.hover_guard = options.hover_guard;

    codegen::Generator generator(std::move(generator_options));
    return generator.generate(sheet);
}

CompileResult try_compile(std::string_view source, const CompileOptions& options) {
    CompileResult result;
    try {
        result.css = compile(source, options);
        result.ok = true;
    } catch (const CompileError& error) {
        result.error = error;
    }
    return result;
}

} // namespace boa
