#include <gtest/gtest.h>
#include <boa/codegen/generator.h>
#include <boa/parser/parser.h>

#include <string>
#include <utility>

using namespace boa::codegen;
using namespace boa::parser;

namespace {

std::string generate(const std::string& source, GeneratorOptions options = {}) {
    Stylesheet sheet = parse_stylesheet(source, options.compact);
    Generator generator(std::move(options));
    return generator.generate(sheet);
}

std::string generate_compact(const std::string& source) {
    GeneratorOptions options;
    options.compact = true;
    return generate(source, options);
}

}  // namespace

// =============================================================================
// Constant scopes and substitution
// =============================================================================

TEST(GeneratorTest, UnknownReferenceBecomesCustomProperty) {
    Generator generator(GeneratorOptions{});
    EXPECT_EQ(generator.substitute("$gap $gap-lg"), "var(--gap) var(--gap-lg)");
}

TEST(GeneratorTest, ConstantReferenceIsInlined) {
    Generator generator(GeneratorOptions{});
    generator.define_constant("bp", "40rem");
    EXPECT_EQ(generator.substitute("(min-width: $bp)"), "(min-width: 40rem)");
}

TEST(GeneratorTest, LoneDollarIsLeftAlone) {
    Generator generator(GeneratorOptions{});
    EXPECT_EQ(generator.substitute("$ 5"), "$ 5");
    EXPECT_EQ(generator.substitute("cost$"), "cost$");
}

TEST(GeneratorTest, InnerScopeShadowsOuter) {
    Generator generator(GeneratorOptions{});
    generator.define_constant("x", "1px");
    generator.push_scope();
    generator.define_constant("x", "2px");
    EXPECT_EQ(generator.lookup_constant("x"), "2px");
    generator.pop_scope();
    EXPECT_EQ(generator.lookup_constant("x"), "1px");
}

TEST(GeneratorTest, FirstDefinitionInScopeWins) {
    Generator generator(GeneratorOptions{});
    generator.define_constant("x", "1px");
    generator.define_constant("x", "2px");
    EXPECT_EQ(generator.lookup_constant("x"), "1px");
}

TEST(GeneratorTest, OutermostScopeIsNeverPopped) {
    Generator generator(GeneratorOptions{});
    generator.define_constant("x", "1px");
    generator.pop_scope();
    generator.pop_scope();
    EXPECT_EQ(generator.lookup_constant("x"), "1px");
    EXPECT_FALSE(generator.lookup_constant("y").has_value());
}

// =============================================================================
// Formatted output
// =============================================================================

TEST(GeneratorTest, SingleRule) {
    EXPECT_EQ(generate("body\n  color: red"), "body {\n  color: red;\n}\n");
}

TEST(GeneratorTest, NestedRuleGetsParentReference) {
    EXPECT_EQ(generate(".card\n  .title\n    color: red"),
              ".card {\n"
              "  & .title {\n"
              "    color: red;\n"
              "  }\n"
              "}\n");
}

TEST(GeneratorTest, RootVariablesAreHoisted) {
    EXPECT_EQ(generate("body\n  color: $c\n$c: #333"),
              ":root {\n"
              "  --c: #333;\n"
              "}\n"
              "\n"
              "body {\n"
              "  color: var(--c);\n"
              "}\n");
}

TEST(GeneratorTest, RootBlockAloneHasNoBlankLine) {
    EXPECT_EQ(generate("$c: red"), ":root {\n  --c: red;\n}\n");
}

TEST(GeneratorTest, VariableInsideRuleStaysInPlace) {
    EXPECT_EQ(generate("body\n  $gap: 1rem\n  margin: $gap"),
              "body {\n"
              "  --gap: 1rem;\n"
              "  margin: var(--gap);\n"
              "}\n");
}

TEST(GeneratorTest, VariableInsideTopLevelAtRuleStaysInPlace) {
    EXPECT_EQ(generate("@media print\n  $ink: black"),
              "@media print {\n"
              "  --ink: black;\n"
              "}\n");
}

TEST(GeneratorTest, ConstantIsScopedToItsBlock) {
    EXPECT_EQ(generate(".a\n  $x: 1px !const\n  margin: $x\n.b\n  margin: $x"),
              ".a {\n"
              "  margin: 1px;\n"
              "}\n"
              ".b {\n"
              "  margin: var(--x);\n"
              "}\n");
}

TEST(GeneratorTest, ConstantsInAtRuleParams) {
    EXPECT_EQ(generate("$bp: 40rem !const\n@media (min-width: $bp)\n  body\n    color: red"),
              "@media (min-width: 40rem) {\n"
              "  body {\n"
              "    color: red;\n"
              "  }\n"
              "}\n");
}

TEST(GeneratorTest, RuleInsideAtRuleInsideRuleIsNested) {
    EXPECT_EQ(generate(".a\n  @media print\n    .b\n      color: red"),
              ".a {\n"
              "  @media print {\n"
              "    & .b {\n"
              "      color: red;\n"
              "    }\n"
              "  }\n"
              "}\n");
}

TEST(GeneratorTest, AtRuleWithoutBlockEndsWithSemicolon) {
    EXPECT_EQ(generate("@import url(a.css)"), "@import url(a.css);\n");
    EXPECT_EQ(generate("@layer"), "@layer;\n");
}

TEST(GeneratorTest, CommentsAreRendered) {
    EXPECT_EQ(generate("// banner\nbody // main\n  color: red // note"),
              "/* banner */\n"
              "body /* main */ {\n"
              "  color: red; /* note */\n"
              "}\n");
}

TEST(GeneratorTest, CustomIndentAndRootSelector) {
    GeneratorOptions options;
    options.indent = "\t";
    options.root_selector = "html";
    EXPECT_EQ(generate("$c: red\n.a\n  .b\n    color: $c", options),
              "html {\n"
              "\t--c: red;\n"
              "}\n"
              "\n"
              ".a {\n"
              "\t& .b {\n"
              "\t\tcolor: var(--c);\n"
              "\t}\n"
              "}\n");
}

// =============================================================================
// Hover guard
// =============================================================================

TEST(GeneratorTest, HoverRuleIsGuarded) {
    EXPECT_EQ(generate("a:hover\n  color: red"),
              "@media (hover: hover) {\n"
              "  a:hover {\n"
              "    color: red;\n"
              "  }\n"
              "}\n");
}

TEST(GeneratorTest, NestedHoverRuleIsGuardedInPlace) {
    EXPECT_EQ(generate(".btn\n  &:hover\n    color: red"),
              ".btn {\n"
              "  @media (hover: hover) {\n"
              "    &:hover {\n"
              "      color: red;\n"
              "    }\n"
              "  }\n"
              "}\n");
}

TEST(GeneratorTest, HocusIsGuarded) {
    EXPECT_EQ(generate("a:hocus\n  color: red"),
              "@media (hover: hover) {\n"
              "  a:is(:hover, :focus-within) {\n"
              "    color: red;\n"
              "  }\n"
              "}\n");
}

TEST(GeneratorTest, HoverGuardCanBeDisabled) {
    GeneratorOptions options;
    options.hover_guard = false;
    EXPECT_EQ(generate("a:hover\n  color: red", options), "a:hover {\n  color: red;\n}\n");
}

// =============================================================================
// Compact output
// =============================================================================

TEST(GeneratorTest, CompactRule) {
    EXPECT_EQ(generate_compact(".a, .b\n  margin: 0  auto\n  .c\n    color: red"),
              ".a,.b{margin:0 auto;& .c{color:red;}}");
}

TEST(GeneratorTest, CompactRootBlock) {
    EXPECT_EQ(generate_compact("$c: #333\nbody\n  color: $c"),
              ":root{--c:#333;}body{color:var(--c);}");
}

TEST(GeneratorTest, CompactAtRuleHeading) {
    EXPECT_EQ(generate_compact("@media (min-width: 40rem)\n  body\n    color: red"),
              "@media(min-width:40rem){body{color:red;}}");
    EXPECT_EQ(generate_compact("@media screen and (hover: hover)\n  a\n    color: red"),
              "@media screen and (hover:hover){a{color:red;}}");
}

TEST(GeneratorTest, CompactHoverGuard) {
    EXPECT_EQ(generate_compact("a:hover\n  color: red"),
              "@media(hover:hover){a:hover{color:red;}}");
}

TEST(GeneratorTest, CompactDropsComments) {
    EXPECT_EQ(generate_compact("/* banner */\nbody // main\n  color: red"),
              "body{color:red;}");
}
