#include <gtest/gtest.h>
#include <chrono>
#include <random>
#include "RunJournal.hpp"
#include "extraction_engine.hpp"
#include "test_support.hpp"

using namespace code_extraction;
using test_support::count_kind;
using test_support::covers_exactly;

namespace {

const char* kFencedPython =
    "# Notes\n"
    "\n"
    "Some text.\n"
    "\n"
    "```python\n"
    "def add(a, b):\n"
    "    return a + b\n"
    "```\n"
    "\n"
    "Done.\n";

const char* kTruncatedPython =
    "# Notes\n"
    "\n"
    "```python\n"
    "def add(a, b):\n"
    "    return a +";

IngestionInput input_of(const std::string& filename, const std::string& bytes) {
    IngestionInput in;
    in.filename = filename;
    in.raw_bytes = bytes;
    return in;
}

} // namespace

class ExtractionEngineTest : public ::testing::Test {
protected:
    ExtractionResult run(const std::string& filename, const std::string& bytes) {
        return engine_.extract(input_of(filename, bytes));
    }

    ExtractionEngine engine_;
    const ScoringWeights& weights() const { return engine_.config().scoring; }
};

TEST_F(ExtractionEngineTest, FencedPythonParsesClean) {
    auto result = run("notes.md", kFencedPython);
    EXPECT_EQ(result.mode, SegmentationMode::MixedContent);
    ASSERT_EQ(result.blocks.size(), 1u);

    const auto& block = result.blocks[0];
    EXPECT_EQ(block.language, "python");
    EXPECT_EQ(block.block_type, BlockType::Ast);
    EXPECT_EQ(block.content, "def add(a, b):\n    return a + b\n");
    EXPECT_EQ(block.start_line, 6u);
    EXPECT_EQ(block.end_line, 7u);
    EXPECT_EQ(block.validation_method, "tree-sitter:python");
    EXPECT_GE(block.confidence_score, weights().ast_floor);
    EXPECT_EQ(block.detection_method, DetectionMethod::Fence);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(result.stats.ast_parsed_count, 1u);
    EXPECT_TRUE(covers_exactly(result, kFencedPython));
}

TEST_F(ExtractionEngineTest, TruncatedFenceDegradesToFallback) {
    auto clean = run("notes.md", kFencedPython);
    auto truncated = run("notes.md", kTruncatedPython);

    ASSERT_EQ(truncated.blocks.size(), 1u);
    const auto& block = truncated.blocks[0];
    EXPECT_EQ(block.language, "python");
    EXPECT_EQ(block.block_type, BlockType::Fallback);
    EXPECT_LE(block.confidence_score, weights().fallback_ceiling);
    EXPECT_LT(block.confidence_score, clean.blocks[0].confidence_score);
    EXPECT_EQ(count_kind(truncated.warnings, DiagnosticKind::ParseFailure), 1u);
    EXPECT_TRUE(covers_exactly(truncated, kTruncatedPython));
}

TEST_F(ExtractionEngineTest, SourceFileWithMissingBraceFallsBack) {
    std::string code = "int main(void) {\n  int x = 1;\n  return x;\n";
    auto result = run("src/main.c", code);

    EXPECT_EQ(result.mode, SegmentationMode::WholeFile);
    ASSERT_EQ(result.blocks.size(), 1u);
    EXPECT_EQ(result.blocks[0].language, "c");
    EXPECT_EQ(result.blocks[0].block_type, BlockType::Fallback);
    EXPECT_EQ(result.blocks[0].content, code);
    EXPECT_EQ(result.blocks[0].validation_method, "rules:c_like");
    EXPECT_LE(result.blocks[0].confidence_score, weights().fallback_ceiling);
    EXPECT_GE(count_kind(result.warnings, DiagnosticKind::ParseFailure), 1u);
    EXPECT_TRUE(result.filler.empty());
}

TEST_F(ExtractionEngineTest, ParserTimeoutDegradesToFallback) {
    EngineConfig cfg;
    cfg.region_timeout_ms = 1;
    cfg.max_ast_region_bytes = 16 << 20;
    ExtractionEngine engine(cfg);

    std::string code;
    for (int i = 0; i < 100000; ++i) code += "def f" + std::to_string(i) + "(a, b):\n    return a + b\n";
    auto result = engine.extract(input_of("src/big.py", code));

    ASSERT_EQ(result.blocks.size(), 1u);
    EXPECT_EQ(result.blocks[0].block_type, BlockType::Fallback);
    EXPECT_EQ(result.blocks[0].language, "python");
    EXPECT_LE(result.blocks[0].confidence_score, cfg.scoring.fallback_ceiling);
    EXPECT_EQ(count_kind(result.warnings, DiagnosticKind::ParseTimeout), 1u);
    EXPECT_TRUE(covers_exactly(result, code));
}

TEST_F(ExtractionEngineTest, CleanSourceFileOutranksItsFallbackReading) {
    std::string code = "int main(void) {\n  int x = 1;\n  return x;\n}\n";
    auto result = run("src/main.c", code);
    ASSERT_EQ(result.blocks.size(), 1u);
    ASSERT_EQ(result.blocks[0].block_type, BlockType::Ast);

    // Score the same region the way the fallback path would.
    FallbackExtractor fallback(engine_.config());
    auto verdict = fallback.classify(code, std::string("c"), true, "lines 1-4");
    ScoreInputs in;
    in.block_type = BlockType::Fallback;
    in.density = verdict.rule_density;
    in.balanced = verdict.balanced;
    in.declared = verdict.declared;
    in.region_lines = 4;
    in.document_lines = 4;
    double fallback_score = ConfidenceScorer(weights()).score(in);

    EXPECT_GT(result.blocks[0].confidence_score, fallback_score);
}

TEST_F(ExtractionEngineTest, UnrecognizedExtensionIsUnknown) {
    auto result = run("data.xyz", "some content here\nint x = 1;\n");
    ASSERT_EQ(result.blocks.size(), 1u);
    EXPECT_EQ(result.blocks[0].language, kUnknownLanguage);
    EXPECT_EQ(result.blocks[0].block_type, BlockType::Fallback);
    EXPECT_FALSE(result.blocks[0].content.empty());
    EXPECT_LE(result.blocks[0].confidence_score, weights().unknown_ceiling);
}

TEST_F(ExtractionEngineTest, ShebangIdentifiesExtensionlessScript) {
    std::string script = "#!/usr/bin/env python3\nimport sys\nprint(sys.argv)\n";
    auto result = run("bin/deploy", script);
    EXPECT_EQ(result.mode, SegmentationMode::WholeFile);
    ASSERT_EQ(result.blocks.size(), 1u);
    EXPECT_EQ(result.blocks[0].language, "python");
    EXPECT_EQ(result.blocks[0].block_type, BlockType::Ast);
}

TEST_F(ExtractionEngineTest, YamlFileParsesStructurally) {
    auto result = run("deploy/config.yaml", "name: app\nreplicas: 3\nports:\n  - 80\n  - 443\n");
    ASSERT_EQ(result.blocks.size(), 1u);
    EXPECT_EQ(result.blocks[0].language, "yaml");
    EXPECT_EQ(result.blocks[0].block_type, BlockType::Ast);
    EXPECT_EQ(result.blocks[0].validation_method, "yaml");
    EXPECT_GE(result.blocks[0].confidence_score, weights().ast_floor);
}

TEST_F(ExtractionEngineTest, CallerHintOverridesPath) {
    IngestionInput in = input_of("snippet.txt", "{\"name\": \"demo\", \"tags\": [1, 2]}\n");
    in.declared_language = "json";
    in.mode = SegmentationMode::WholeFile;
    in.source_file_id = "upload-17";
    auto result = engine_.extract(in);

    ASSERT_EQ(result.blocks.size(), 1u);
    EXPECT_EQ(result.source_file_id, "upload-17");
    EXPECT_EQ(result.blocks[0].language, "json");
    EXPECT_EQ(result.blocks[0].validation_method, "json");
    EXPECT_EQ(result.blocks[0].block_id.rfind("upload-17#", 0), 0u);
}

TEST_F(ExtractionEngineTest, UnregisteredFenceLabelIsKept) {
    std::string doc = "Intro\n```cobol\nDISPLAY 'HELLO'.\nSTOP RUN.\n```\n";
    auto result = run("legacy.md", doc);
    ASSERT_EQ(result.blocks.size(), 1u);
    EXPECT_EQ(result.blocks[0].language, "cobol");
    EXPECT_EQ(result.blocks[0].block_type, BlockType::Fallback);
    EXPECT_EQ(count_kind(result.warnings, DiagnosticKind::UnsupportedLanguage), 1u);
}

TEST_F(ExtractionEngineTest, SeveralRegionsInOneDocument) {
    std::string doc =
        "Setup notes.\n"
        "```bash\necho \"$HOME\"\n```\n"
        "Then the config:\n"
        "```json\n{\"debug\": true}\n```\n"
        "And a broken one:\n"
        "```c\nint f( {\n```\n";
    auto result = run("setup.md", doc);
    ASSERT_EQ(result.blocks.size(), 3u);
    EXPECT_EQ(result.blocks[0].language, "bash");
    EXPECT_EQ(result.blocks[0].block_type, BlockType::Ast);
    EXPECT_EQ(result.blocks[1].language, "json");
    EXPECT_EQ(result.blocks[1].block_type, BlockType::Ast);
    EXPECT_EQ(result.blocks[2].language, "c");
    EXPECT_EQ(result.blocks[2].block_type, BlockType::Fallback);
    EXPECT_EQ(result.stats.ast_parsed_count, 2u);
    EXPECT_EQ(result.stats.fallback_extracted_count, 1u);
    EXPECT_TRUE(covers_exactly(result, doc));
}

TEST_F(ExtractionEngineTest, IdenticalInputGivesIdenticalOutput) {
    std::string doc = std::string(kFencedPython) + "\n    while (x) {\n        x--;\n    }\n";
    auto first = run("notes.md", doc).to_json().dump();
    auto second = run("notes.md", doc).to_json().dump();
    EXPECT_EQ(first, second);
}

TEST_F(ExtractionEngineTest, RandomDocumentsAreCoveredExactly) {
    const std::vector<std::string> pieces = {
        "The quick brown fox jumps over the lazy dog.\n",
        "```python\ndef f(x):\n    return x * 2\n```\n",
        "```\nplain fenced text\n```\n",
        "    for (i = 0; i < n; i++) {\n        total += i;\n    }\n",
        "int g(int a) {\n  if (a > 1) { return a * g(a - 1); }\n  return 1;\n}\n",
        "x = 1\n",
        "\n",
        "windows line\r\n",
        "bad \xFF byte\n",
        "```js\nconst broken = (\n",
    };

    DocumentNormalizer normalizer;
    for (unsigned seed = 1; seed <= 25; ++seed) {
        std::mt19937 rng(seed);
        std::uniform_int_distribution<size_t> pick(0, pieces.size() - 1);
        std::uniform_int_distribution<int> count(1, 14);

        std::string raw;
        for (int n = count(rng); n > 0; --n) raw += pieces[pick(rng)];

        auto result = run("random.md", raw);
        std::string text = normalizer.normalize(raw, "random.md").document.text();
        EXPECT_TRUE(covers_exactly(result, text)) << "seed " << seed;
        for (const auto& b : result.blocks) {
            if (b.block_type == BlockType::Ast) EXPECT_GE(b.confidence_score, weights().ast_floor);
            else EXPECT_LE(b.confidence_score, weights().fallback_ceiling);
        }
    }
}

TEST_F(ExtractionEngineTest, EmptyInputYieldsEmptyResult) {
    auto result = run("empty.py", "");
    EXPECT_TRUE(result.blocks.empty());
    EXPECT_TRUE(result.filler.empty());
    EXPECT_EQ(result.document_size, 0u);
    EXPECT_EQ(result.stats.total_extracted_count, 0u);
}

TEST_F(ExtractionEngineTest, DecodeWarningsTravelWithResult) {
    auto result = run("notes.txt", "intro \xFF\n\n```python\nx = 1\n```\n");
    EXPECT_EQ(count_kind(result.warnings, DiagnosticKind::DecodeWarning), 1u);
    ASSERT_EQ(result.blocks.size(), 1u);
    EXPECT_EQ(result.blocks[0].block_type, BlockType::Ast);
}

TEST_F(ExtractionEngineTest, UnreadableInputIsADecodeFailure) {
    RunJournal::instance().clear();
    EXPECT_THROW(run("blob.txt", "\xFF\xFF"), DecodeFailure);
    auto runs = RunJournal::instance().get_runs_json();
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0]["outcome"], "failed");
}

TEST_F(ExtractionEngineTest, CancelledTokenStopsTheRun) {
    CancellationToken token;
    token.cancel();
    try {
        engine_.extract(input_of("a.py", "x = 1\n"), &token);
        FAIL() << "expected RunCancelled";
    } catch (const RunCancelled& e) {
        EXPECT_FALSE(e.timed_out());
    }
}

TEST_F(ExtractionEngineTest, ExpiredDeadlineIsATimeout) {
    CancellationToken token;
    token.set_deadline(CancellationToken::clock::now() - std::chrono::milliseconds(1));
    try {
        engine_.extract(input_of("a.py", "x = 1\n"), &token);
        FAIL() << "expected RunCancelled";
    } catch (const RunCancelled& e) {
        EXPECT_TRUE(e.timed_out());
    }
}

TEST_F(ExtractionEngineTest, RunsAreJournaled) {
    RunJournal::instance().clear();
    run("first.py", "x = 1\n");
    run("second.md", kFencedPython);

    auto runs = RunJournal::instance().get_runs_json();
    ASSERT_EQ(runs.size(), 2u);
    EXPECT_EQ(runs[0]["source_file_id"], "second.md");
    EXPECT_EQ(runs[0]["mode"], "mixed_content");
    EXPECT_EQ(runs[0]["ast_blocks"], 1);
    EXPECT_EQ(runs[1]["source_file_id"], "first.py");
    EXPECT_EQ(runs[1]["outcome"], "completed");
}

TEST(ExtractionEngineConfigTest, InvalidConfigIsRejected) {
    EngineConfig cfg;
    cfg.scoring.fallback_ceiling = 0.9;
    EXPECT_THROW(ExtractionEngine{cfg}, ConfigError);
}
