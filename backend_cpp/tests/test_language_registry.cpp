#include <gtest/gtest.h>
#include <set>
#include "extraction_errors.hpp"
#include "language_registry.hpp"

using namespace code_extraction;

namespace {

LanguageProfile minimal_profile(const std::string& id, const std::string& ext, const std::string& pattern = "x") {
    LanguageProfile p;
    p.id = id;
    p.display_name = id;
    p.extensions = {ext};
    p.fallback.rules = {HeuristicRule{pattern, 1.0, false, {}}};
    return p;
}

} // namespace

TEST(LanguageRegistryTest, FindsByIdAndAlias) {
    const auto& reg = LanguageRegistry::instance();
    ASSERT_NE(reg.find("Python"), nullptr);
    EXPECT_EQ(reg.find("Python")->id, "python");
    EXPECT_EQ(reg.find(" py ")->id, "python");
    EXPECT_EQ(reg.find("c++")->id, "cpp");
    EXPECT_EQ(reg.find("golang")->id, "go");
    EXPECT_EQ(reg.find("shell")->id, "bash");
    EXPECT_EQ(reg.find("nope"), nullptr);
}

TEST(LanguageRegistryTest, ResolvesPaths) {
    const auto& reg = LanguageRegistry::instance();
    EXPECT_EQ(reg.from_path("src/main.rs")->id, "rust");
    EXPECT_EQ(reg.from_path("A.PY")->id, "python");
    EXPECT_EQ(reg.from_path("docker/Dockerfile")->id, "dockerfile");
    EXPECT_EQ(reg.from_path("Makefile")->id, "makefile");
    EXPECT_EQ(reg.from_path("conf/nginx.conf")->id, "nginx");
    EXPECT_EQ(reg.from_path("data.xyz"), nullptr);
    EXPECT_EQ(reg.from_path("README"), nullptr);
}

TEST(LanguageRegistryTest, ResolvesShebangs) {
    const auto& reg = LanguageRegistry::instance();
    EXPECT_EQ(reg.from_shebang("#!/usr/bin/env python3\nprint(1)\n")->id, "python");
    EXPECT_EQ(reg.from_shebang("#!/bin/bash\necho hi\n")->id, "bash");
    EXPECT_EQ(reg.from_shebang("#!/usr/bin/env -S node --no-warnings\n")->id, "javascript");
    EXPECT_EQ(reg.from_shebang("#!/opt/bin/unknown-tool\n"), nullptr);
    EXPECT_EQ(reg.from_shebang("print(1)\n"), nullptr);
}

TEST(LanguageRegistryTest, ClassifiesDocumentPaths) {
    const auto& reg = LanguageRegistry::instance();
    EXPECT_TRUE(reg.is_document_path("README.md"));
    EXPECT_TRUE(reg.is_document_path("notes/todo.TXT"));
    EXPECT_TRUE(reg.is_document_path("manual.pdf"));
    EXPECT_TRUE(reg.is_document_path("README"));
    EXPECT_FALSE(reg.is_document_path("Makefile"));
    EXPECT_FALSE(reg.is_document_path("main.cpp"));
    EXPECT_FALSE(reg.is_document_path("data.xyz"));
}

TEST(LanguageRegistryTest, DefaultTableIsConsistent) {
    const auto& reg = LanguageRegistry::instance();
    std::set<std::string> ids;
    for (const auto& p : reg.profiles()) {
        EXPECT_TRUE(ids.insert(p.id).second) << p.id;
        EXPECT_FALSE(p.fallback.rules.empty()) << p.id;
        EXPECT_EQ(p.fallback.family, p.family) << p.id;
    }
    EXPECT_GE(ids.size(), 20u);
    EXPECT_TRUE(reg.find("json")->has_grammar());
    EXPECT_TRUE(reg.find("xml")->has_grammar());
    EXPECT_TRUE(reg.find("yaml")->has_grammar());
    EXPECT_FALSE(reg.find("ruby")->has_grammar());
}

TEST(LanguageRegistryTest, RejectsDuplicateKeys) {
    std::vector<LanguageProfile> profiles = {minimal_profile("one", ".foo"), minimal_profile("two", ".foo")};
    EXPECT_THROW(LanguageRegistry{profiles}, ConfigError);

    std::vector<LanguageProfile> same_id = {minimal_profile("dup", ".a"), minimal_profile("dup", ".b")};
    EXPECT_THROW(LanguageRegistry{same_id}, ConfigError);
}

TEST(LanguageRegistryTest, RejectsBadPatternsAndEmptyRules) {
    std::vector<LanguageProfile> bad_pattern = {minimal_profile("broken", ".b", "(")};
    EXPECT_THROW(LanguageRegistry{bad_pattern}, ConfigError);

    std::vector<LanguageProfile> no_rules = {minimal_profile("empty", ".e")};
    no_rules[0].fallback.rules.clear();
    EXPECT_THROW(LanguageRegistry{no_rules}, ConfigError);
}

TEST(LanguageRegistryTest, SmallTableWorksIndependently) {
    std::vector<LanguageProfile> table = {minimal_profile("foo", ".foo", "^foo\\b")};
    LanguageRegistry reg(table);
    EXPECT_EQ(reg.from_path("a.foo")->id, "foo");
    EXPECT_EQ(reg.find("python"), nullptr);
}

TEST(LanguageRegistryTest, RanksPythonBySignature) {
    const auto& reg = LanguageRegistry::instance();
    std::string code =
        "def add(a, b):\n"
        "    return a + b\n"
        "\n"
        "class Foo:\n"
        "    def __init__(self):\n"
        "        self.x = 1\n";
    auto ranked = reg.rank_by_signature(code, true);
    ASSERT_FALSE(ranked.empty());
    EXPECT_EQ(ranked.front().profile->id, "python");
    for (const auto& r : ranked) EXPECT_TRUE(r.profile->has_grammar());
}

TEST(LanguageRegistryTest, ShebangBoostsSignatureScore) {
    const auto& reg = LanguageRegistry::instance();
    const auto* bash = reg.find("bash");
    double plain = reg.signature_score(*bash, "echo hi\n");
    double with_shebang = reg.signature_score(*bash, "#!/bin/sh\necho hi\n");
    EXPECT_GT(with_shebang, plain + 0.5);
}

TEST(MatchDensityTest, AveragesSaturatedLineScores) {
    std::vector<HeuristicRule> rules = {HeuristicRule{"foo", 2.0, false, std::regex("foo")},
                                        HeuristicRule{"bar", 0.5, false, std::regex("bar")}};
    auto d = match_density({&rules}, "foo\nbar\n\nfoo foo\nbaz\n");
    EXPECT_EQ(d.scored_lines, 4u);
    EXPECT_EQ(d.matched_lines, 3u);
    // (1.0 + 0.25 + 1.0 + 0) / 4
    EXPECT_DOUBLE_EQ(d.density, 2.25 / 4.0);

    auto capped = match_density({&rules}, "foo\nfoo\nbaz\nbaz\n", 2);
    EXPECT_EQ(capped.scored_lines, 2u);
    EXPECT_DOUBLE_EQ(capped.density, 1.0);
}

TEST(MatchDensityTest, SkipsOverlongLines) {
    std::vector<HeuristicRule> rules = {HeuristicRule{"foo", 2.0, false, std::regex("foo")}};
    auto d = match_density({&rules}, "foo" + std::string(kMaxRuleLineLength + 10, 'x'));
    EXPECT_EQ(d.scored_lines, 1u);
    EXPECT_EQ(d.matched_lines, 0u);
    EXPECT_DOUBLE_EQ(d.density, 0.0);
}
