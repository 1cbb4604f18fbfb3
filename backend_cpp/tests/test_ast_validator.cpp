#include <gtest/gtest.h>
#include "ast_validator.hpp"
#include "test_support.hpp"

using namespace code_extraction;
using test_support::count_kind;

namespace {

// A few megabytes of valid Python: far more than a 1 ms parse budget covers.
std::string many_functions(size_t count) {
    std::string text;
    for (size_t i = 0; i < count; ++i) text += "def f" + std::to_string(i) + "(a, b):\n    return a + b\n";
    return text;
}

} // namespace

class AstValidatorTest : public ::testing::Test {
protected:
    AstVerdict check(const std::string& text, const std::string& language, bool unterminated = false) {
        AstValidator validator(config_);
        return validator.validate(text, registry().find(language), unterminated, "lines 1-9");
    }

    AstVerdict guess(const std::string& text) {
        AstValidator validator(config_);
        return validator.validate(text, nullptr, false, "lines 1-9");
    }

    static const LanguageRegistry& registry() { return LanguageRegistry::instance(); }

    EngineConfig config_;
};

TEST_F(AstValidatorTest, AcceptsCleanPython) {
    auto v = check("def add(a, b):\n    return a + b\n", "python");
    ASSERT_TRUE(v.accepted);
    EXPECT_EQ(v.profile->id, "python");
    EXPECT_EQ(v.validation_method, "tree-sitter:python");
    EXPECT_GT(v.node_count, 3u);
    EXPECT_TRUE(v.diagnostics.empty());
}

TEST_F(AstValidatorTest, RejectsBrokenPython) {
    auto v = check("def add(a, b:\n    return a + b\n", "python");
    EXPECT_FALSE(v.accepted);
    ASSERT_EQ(count_kind(v.diagnostics, DiagnosticKind::ParseFailure), 1u);
    EXPECT_NE(v.diagnostics[0].message.find("lines 1-9"), std::string::npos);
}

TEST_F(AstValidatorTest, MissingClosingBraceIsNotClean) {
    EXPECT_TRUE(check("int main(void) {\n  return 0;\n}\n", "c").accepted);
    EXPECT_FALSE(check("int main(void) {\n  return 0;\n", "c").accepted);
}

TEST_F(AstValidatorTest, OtherTreeSitterGrammars) {
    EXPECT_TRUE(check("fn main() {\n    let x = 1;\n}\n", "rust").accepted);
    EXPECT_TRUE(check("package main\n\nfunc main() {}\n", "go").accepted);
    EXPECT_TRUE(check("const f = (a) => a * 2;\n", "javascript").accepted);
    EXPECT_TRUE(check("echo \"$HOME\" | wc -c\n", "bash").accepted);
}

TEST_F(AstValidatorTest, JsonNeedsAContainerRoot) {
    auto ok = check("{\"a\": [1, 2, {\"b\": null}]}", "json");
    ASSERT_TRUE(ok.accepted);
    EXPECT_EQ(ok.validation_method, "json");
    EXPECT_EQ(ok.node_count, 6u);

    EXPECT_FALSE(check("{\"a\": [1, 2}", "json").accepted);
    EXPECT_FALSE(check("42", "json").accepted);
}

TEST_F(AstValidatorTest, YamlNeedsAMappingOrSequenceRoot) {
    auto ok = check("name: app\nitems:\n  - a\n  - b\n", "yaml");
    ASSERT_TRUE(ok.accepted);
    EXPECT_EQ(ok.validation_method, "yaml");
    EXPECT_EQ(ok.node_count, 5u);

    EXPECT_TRUE(check("- one\n- two\n", "yaml").accepted);
    EXPECT_FALSE(check("just a sentence of prose\n", "yaml").accepted);
    EXPECT_FALSE(check("key: [1, 2\n", "yaml").accepted);
    EXPECT_FALSE(check("", "yaml").accepted);
}

TEST_F(AstValidatorTest, YamlAliasExpansionIsBounded) {
    std::string laughs = "l0: &l0 [x, x]\n";
    for (int i = 1; i < 24; ++i) {
        laughs += "l" + std::to_string(i) + ": &l" + std::to_string(i) + " [*l" + std::to_string(i - 1) +
                  ", *l" + std::to_string(i - 1) + "]\n";
    }
    auto v = check(laughs, "yaml");
    EXPECT_FALSE(v.accepted);
    ASSERT_EQ(count_kind(v.diagnostics, DiagnosticKind::ParseFailure), 1u);
    EXPECT_NE(v.diagnostics[0].message.find("aliases"), std::string::npos);
}

TEST_F(AstValidatorTest, XmlNeedsWellFormedDocument) {
    auto ok = check("<root><child a=\"1\"/><child/></root>", "xml");
    ASSERT_TRUE(ok.accepted);
    EXPECT_EQ(ok.validation_method, "xml");
    EXPECT_EQ(ok.node_count, 3u);

    EXPECT_FALSE(check("<root><child></root>", "xml").accepted);
}

TEST_F(AstValidatorTest, UnterminatedRegionIsNeverParsed) {
    auto v = check("def add(a, b):\n    return a + b\n", "python", true);
    EXPECT_FALSE(v.accepted);
    ASSERT_EQ(v.diagnostics.size(), 1u);
    EXPECT_NE(v.diagnostics[0].message.find("unterminated"), std::string::npos);
}

TEST_F(AstValidatorTest, OversizeRegionIsSkipped) {
    config_.max_ast_region_bytes = 8;
    auto v = check("def add(a, b):\n    return a + b\n", "python");
    EXPECT_FALSE(v.accepted);
    ASSERT_EQ(count_kind(v.diagnostics, DiagnosticKind::ParseFailure), 1u);
    EXPECT_NE(v.diagnostics[0].message.find("exceeds"), std::string::npos);
}

TEST_F(AstValidatorTest, DeepNestingIsSkipped) {
    config_.max_nesting_depth = 3;
    auto v = check("[[[[[1]]]]]", "json");
    EXPECT_FALSE(v.accepted);
    EXPECT_EQ(count_kind(v.diagnostics, DiagnosticKind::ParseFailure), 1u);
}

TEST_F(AstValidatorTest, FallbackOnlyLanguageIsSilentlyDeclined) {
    auto v = check("puts 'hi'\n", "ruby");
    EXPECT_FALSE(v.accepted);
    EXPECT_TRUE(v.diagnostics.empty());
}

TEST_F(AstValidatorTest, GuessesLanguageFromSignatures) {
    auto v = guess("import os\n\ndef main():\n    print(os.getcwd())\n");
    ASSERT_TRUE(v.accepted);
    EXPECT_EQ(v.profile->id, "python");

    // No signature matches at all: nothing is attempted.
    auto none = guess("lorem ipsum dolor\n");
    EXPECT_FALSE(none.accepted);
    EXPECT_TRUE(none.diagnostics.empty());
}

TEST_F(AstValidatorTest, ValidatorIsReusableAcrossRegions) {
    AstValidator validator(config_);
    const auto* python = registry().find("python");
    EXPECT_FALSE(validator.validate("def (:\n", python, false, "a").accepted);
    EXPECT_TRUE(validator.validate("x = 1\n", python, false, "b").accepted);
    EXPECT_TRUE(validator.validate("[1, 2]", registry().find("json"), false, "c").accepted);
}

TEST_F(AstValidatorTest, TimeoutIsReportedAndParserStaysUsable) {
    config_.region_timeout_ms = 1;
    config_.max_ast_region_bytes = 16 << 20;
    AstValidator validator(config_);
    const auto* python = registry().find("python");

    auto slow = validator.validate(many_functions(100000), python, false, "lines 1-200000");
    EXPECT_FALSE(slow.accepted);
    ASSERT_EQ(count_kind(slow.diagnostics, DiagnosticKind::ParseTimeout), 1u);
    EXPECT_EQ(count_kind(slow.diagnostics, DiagnosticKind::ParseFailure), 0u);
    EXPECT_NE(slow.diagnostics[0].message.find("timed out after 1 ms"), std::string::npos);

    auto quick = validator.validate("x = 1\n", python, false, "lines 1-1");
    EXPECT_TRUE(quick.accepted);
    EXPECT_TRUE(quick.diagnostics.empty());
}

TEST(BracketDepthTest, IgnoresQuotedBrackets) {
    EXPECT_EQ(bracket_depth("a(b[c{d}])"), 3u);
    EXPECT_EQ(bracket_depth("\"(((\" + '['"), 0u);
    EXPECT_EQ(bracket_depth(")))("), 1u);
}
