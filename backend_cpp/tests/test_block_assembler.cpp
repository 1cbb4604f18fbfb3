#include <gtest/gtest.h>
#include "block_assembler.hpp"
#include "test_support.hpp"

using namespace code_extraction;
using test_support::count_kind;
using test_support::covers_exactly;

namespace {

RegionOutcome outcome(size_t start, size_t end, double confidence, const std::string& language = "python",
                      BlockType type = BlockType::Ast) {
    RegionOutcome o;
    o.region.start_offset = start;
    o.region.end_offset = end;
    o.region.detection_method = DetectionMethod::Fence;
    o.language = language;
    o.block_type = type;
    o.confidence = confidence;
    o.validation_method = type == BlockType::Ast ? "tree-sitter:" + language : "rules:c_like";
    return o;
}

// Ten lines of ten bytes each ("line 0...\n").
std::string ten_lines() {
    std::string text;
    for (int i = 0; i < 10; ++i) text += "line " + std::to_string(i) + "...\n";
    return text;
}

} // namespace

TEST(BlockAssemblerTest, DisjointRegionsAndFiller) {
    SourceDocument doc(ten_lines());
    BlockAssembler assembler;
    auto result = assembler.assemble(doc, "doc.md",
                                     {outcome(50, 70, 0.6, "c", BlockType::Fallback), outcome(10, 30, 0.9)}, {});

    ASSERT_EQ(result.blocks.size(), 2u);
    EXPECT_EQ(result.blocks[0].start_offset, 10u);
    EXPECT_EQ(result.blocks[0].start_line, 2u);
    EXPECT_EQ(result.blocks[0].end_line, 3u);
    EXPECT_EQ(result.blocks[0].content, "line 1...\nline 2...\n");
    EXPECT_EQ(result.blocks[0].status, BlockStatus::Pending);
    EXPECT_EQ(result.blocks[1].language, "c");

    ASSERT_EQ(result.filler.size(), 3u);
    EXPECT_EQ(result.filler[0].end_offset, 10u);
    EXPECT_EQ(result.filler[1].start_offset, 30u);
    EXPECT_EQ(result.filler[2].start_offset, 70u);
    EXPECT_EQ(result.filler[2].end_offset, doc.size());

    EXPECT_EQ(result.stats.ast_parsed_count, 1u);
    EXPECT_EQ(result.stats.fallback_extracted_count, 1u);
    EXPECT_EQ(result.stats.total_extracted_count, 2u);
    EXPECT_TRUE(covers_exactly(result, doc.text()));
    EXPECT_TRUE(result.warnings.empty());
}

TEST(BlockAssemblerTest, OverlapKeepsHigherConfidence) {
    SourceDocument doc(ten_lines());
    BlockAssembler assembler;
    auto result = assembler.assemble(doc, "doc.md", {outcome(10, 40, 0.5, "c", BlockType::Fallback),
                                                     outcome(20, 60, 0.8)}, {});

    ASSERT_EQ(result.blocks.size(), 1u);
    EXPECT_EQ(result.blocks[0].start_offset, 20u);
    EXPECT_EQ(result.blocks[0].end_offset, 60u);
    ASSERT_EQ(count_kind(result.warnings, DiagnosticKind::CoverageWarning), 1u);
    EXPECT_NE(result.warnings[0].message.find("[10, 40) dropped in favour of [20, 60)"), std::string::npos);
    EXPECT_TRUE(covers_exactly(result, doc.text()));
}

TEST(BlockAssemblerTest, NestedLoserNeedsNoWarning) {
    SourceDocument doc(ten_lines());
    BlockAssembler assembler;
    auto result = assembler.assemble(doc, "doc.md", {outcome(10, 60, 0.9), outcome(20, 30, 0.5)}, {});
    ASSERT_EQ(result.blocks.size(), 1u);
    EXPECT_EQ(result.blocks[0].end_offset, 60u);
    EXPECT_TRUE(result.warnings.empty());
}

TEST(BlockAssemblerTest, TieKeepsTheEarlierRegion) {
    SourceDocument doc(ten_lines());
    BlockAssembler assembler;
    auto result = assembler.assemble(doc, "doc.md", {outcome(30, 50, 0.7), outcome(10, 40, 0.7)}, {});
    ASSERT_EQ(result.blocks.size(), 1u);
    EXPECT_EQ(result.blocks[0].start_offset, 10u);
    EXPECT_EQ(count_kind(result.warnings, DiagnosticKind::CoverageWarning), 1u);
}

TEST(BlockAssemblerTest, CarriesIncomingWarnings) {
    SourceDocument doc(ten_lines());
    BlockAssembler assembler;
    auto result = assembler.assemble(doc, "doc.md", {},
                                     {{DiagnosticKind::DecodeWarning, "Replaced 1 invalid utf-8 sequence(s)"}});
    EXPECT_TRUE(result.blocks.empty());
    ASSERT_EQ(result.filler.size(), 1u);
    EXPECT_EQ(result.warnings.size(), 1u);
    EXPECT_TRUE(covers_exactly(result, doc.text()));
}

TEST(BlockAssemblerTest, BlockIdsAreStableAndContentAddressed) {
    std::string a = BlockAssembler::block_id("src/a.py", 0, 10, "print(1)\n");
    EXPECT_EQ(a, BlockAssembler::block_id("src/a.py", 0, 10, "print(1)\n"));
    EXPECT_EQ(a.rfind("src/a.py#", 0), 0u);
    EXPECT_EQ(a.size(), std::string("src/a.py#").size() + 16);

    EXPECT_NE(a, BlockAssembler::block_id("src/a.py", 0, 10, "print(2)\n"));
    EXPECT_NE(a, BlockAssembler::block_id("src/a.py", 5, 15, "print(1)\n"));
    EXPECT_NE(a, BlockAssembler::block_id("src/b.py", 0, 10, "print(1)\n"));
}

TEST(BlockAssemblerTest, ComplementOfNothingIsEverything) {
    auto filler = BlockAssembler::complement({}, 42);
    ASSERT_EQ(filler.size(), 1u);
    EXPECT_EQ(filler[0].start_offset, 0u);
    EXPECT_EQ(filler[0].end_offset, 42u);
    EXPECT_TRUE(BlockAssembler::complement({}, 0).empty());
}
