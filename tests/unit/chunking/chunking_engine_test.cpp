#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docsplit_core/chunking/chunking_engine.hpp"
#include "docsplit_core/content_hash.hpp"
#include "docsplit_core/serialization/json.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace docsplit_core {

using docsplit_tests::TestUtilities::count_occurrences;
using docsplit_tests::TestUtilities::make_config;
using docsplit_tests::TestUtilities::make_mixed_document;
using docsplit_tests::TestUtilities::reconstruct;
using docsplit_tests::TestUtilities::repeat;

class ChunkingEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    mock_client_ = std::make_shared<::testing::NiceMock<docsplit_tests::MockEnrichmentClient>>();
    // 46-byte sentence, 300 times
    long_prose_ = repeat("Lorem ipsum dolor sit amet, consectetur elit. ", 300);
  }

  std::unique_ptr<ChunkingEngine> make_engine(const ChunkingConfig& config,
                                              EnrichmentClientPtr client = nullptr) {
    return std::make_unique<ChunkingEngine>(config, std::move(client),
                                            structure::StructurePatterns::markdown(),
                                            std::chrono::milliseconds(0));
  }

  void expect_contiguous(const std::vector<DocumentChunk>& chunks) {
    for (size_t i = 0; i < chunks.size(); ++i) {
      EXPECT_EQ(chunks[i].index, i);
      EXPECT_EQ(chunks[i].metadata.chunk_index, i);
      EXPECT_EQ(chunks[i].metadata.total_chunks, chunks.size());
      if (i > 0) {
        EXPECT_LT(chunks[i - 1].start_char, chunks[i].start_char);
        EXPECT_LE(chunks[i].start_char, chunks[i - 1].end_char);
        EXPECT_LT(chunks[i - 1].end_char, chunks[i].end_char);
      }
    }
  }

  std::shared_ptr<::testing::NiceMock<docsplit_tests::MockEnrichmentClient>> mock_client_;
  std::string long_prose_;
};

TEST_F(ChunkingEngineTest, ShortDocumentIsASingleChunk) {
  auto engine = make_engine(ChunkingConfig::defaults());

  auto chunks = engine->chunk_document("doc-1", "Short text.");

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].id, "doc-1-chunk-0");
  EXPECT_EQ(chunks[0].document_id, "doc-1");
  EXPECT_EQ(chunks[0].content, "Short text.");
  EXPECT_EQ(chunks[0].start_char, 0u);
  EXPECT_EQ(chunks[0].end_char, 11u);
  EXPECT_EQ(chunks[0].metadata.chunk_index, 0u);
  EXPECT_EQ(chunks[0].metadata.total_chunks, 1u);
  EXPECT_FALSE(chunks[0].overlap_start.has_value());
  EXPECT_FALSE(chunks[0].overlap_end.has_value());
  EXPECT_FALSE(chunks[0].metadata.previous_chunk_id.has_value());
  EXPECT_FALSE(chunks[0].metadata.next_chunk_id.has_value());
}

TEST_F(ChunkingEngineTest, DocumentBelowMinimumStillProducesOneChunk) {
  auto engine = make_engine(ChunkingConfig::defaults());

  auto report = engine->chunk_document_with_report("doc", "tiny");

  ASSERT_EQ(report.chunks.size(), 1u);
  EXPECT_EQ(report.statistics.undersized_chunks, 0u);
}

TEST_F(ChunkingEngineTest, LongProseSplitsWithinBudgetAndOverlaps) {
  auto engine = make_engine(ChunkingConfig::defaults());
  const size_t budget = engine->config().effective_budget();

  auto chunks = engine->chunk_document("doc", long_prose_);

  ASSERT_GT(chunks.size(), 1u);
  for (const auto& chunk : chunks) {
    EXPECT_LE(chunk.content.size(), budget);
  }
  expect_contiguous(chunks);
  EXPECT_EQ(reconstruct(chunks), long_prose_);
  EXPECT_EQ(chunks.back().end_char, long_prose_.size());

  // The first chunk ends on a sentence boundary and shares about 15% with the next
  EXPECT_EQ(chunks[0].end_char % 46, 0u);
  ASSERT_TRUE(chunks[0].metadata.overlap_with_next.has_value());
  EXPECT_NEAR(static_cast<double>(*chunks[0].metadata.overlap_with_next),
              0.15 * static_cast<double>(chunks[0].content.size()), 1.0);
}

TEST_F(ChunkingEngineTest, NavigationAndOverlapFieldsOnlyWhereNeighborsExist) {
  auto engine = make_engine(make_config(1000, 15));

  auto chunks = engine->chunk_document("doc", long_prose_);

  ASSERT_GT(chunks.size(), 2u);
  EXPECT_FALSE(chunks.front().overlap_start.has_value());
  EXPECT_FALSE(chunks.front().metadata.previous_chunk_id.has_value());
  EXPECT_FALSE(chunks.back().overlap_end.has_value());
  EXPECT_FALSE(chunks.back().metadata.next_chunk_id.has_value());

  for (size_t i = 1; i + 1 < chunks.size(); ++i) {
    EXPECT_TRUE(chunks[i].overlap_start.has_value());
    EXPECT_TRUE(chunks[i].overlap_end.has_value());
    EXPECT_EQ(chunks[i].metadata.previous_chunk_id, chunks[i - 1].id);
    EXPECT_EQ(chunks[i].metadata.next_chunk_id, chunks[i + 1].id);
    EXPECT_EQ(chunks[i].metadata.overlap_with_previous,
              chunks[i - 1].end_char - chunks[i].start_char);
    EXPECT_EQ(chunks[i].metadata.overlap_with_next, chunks[i].end_char - chunks[i + 1].start_char);
  }
}

TEST_F(ChunkingEngineTest, UnstructuredTextIsForcedAtTheBudget) {
  auto engine = make_engine(make_config(100, 20));
  const std::string text(500, 'a');

  auto report = engine->chunk_document_with_report("doc", text);
  const auto& chunks = report.chunks;

  ASSERT_EQ(chunks.size(), 6u);
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].start_char, 80 * i);
    EXPECT_EQ(chunks[i].content.size(), 100u);
  }
  for (size_t i = 0; i + 1 < chunks.size(); ++i) {
    ASSERT_TRUE(chunks[i].metadata.overlap_with_next.has_value());
    EXPECT_NEAR(static_cast<double>(*chunks[i].metadata.overlap_with_next), 20.0, 1.0);
  }
  EXPECT_EQ(report.warnings.size(), 5u);
  EXPECT_EQ(reconstruct(chunks), text);
}

TEST_F(ChunkingEngineTest, CodeBlocksAndTablesAreNeverSplit) {
  auto engine = make_engine(make_config(300, 15));
  const std::string doc = make_mixed_document(12);
  const auto regions =
      structure::find_protected_regions(doc, structure::StructurePatterns::markdown());

  auto chunks = engine->chunk_document("doc", doc);

  ASSERT_GT(chunks.size(), 3u);
  for (const auto& chunk : chunks) {
    EXPECT_LE(chunk.content.size(), 300u);
    EXPECT_EQ(count_occurrences(chunk.content, "```") % 2, 0u) << chunk.id;
    EXPECT_EQ(structure::region_containing(regions, chunk.start_char), nullptr) << chunk.id;
    EXPECT_EQ(structure::region_containing(regions, chunk.end_char), nullptr) << chunk.id;
  }
  expect_contiguous(chunks);
  EXPECT_EQ(reconstruct(chunks), doc);
}

TEST_F(ChunkingEngineTest, OversizedCodeBlockIsSplitWithWarning) {
  auto engine = make_engine(make_config(200, 0));
  const std::string doc = "```\n" + repeat("x = 1\n", 100) + "```\n";

  auto report = engine->chunk_document_with_report("doc", doc);

  ASSERT_GT(report.chunks.size(), 1u);
  for (const auto& chunk : report.chunks) {
    EXPECT_LE(chunk.content.size(), 200u);
  }
  EXPECT_FALSE(report.warnings.empty());
  EXPECT_EQ(reconstruct(report.chunks), doc);
}

TEST_F(ChunkingEngineTest, CodeBlockReachedThroughOverlapStaysWhole) {
  auto engine = make_engine(make_config(100, 20));
  // A 90-byte block after 60 bytes of text; the first chunk stops at the
  // fence and the overlap moves the next start back in front of it
  const std::string block = "```" + std::string(84, 'b') + "```";
  const std::string doc = std::string(60, 'a') + block + "\n" + std::string(100, 'c');

  auto report = engine->chunk_document_with_report("doc", doc);
  const auto& chunks = report.chunks;

  ASSERT_EQ(chunks.size(), 4u);
  EXPECT_EQ(chunks[0].end_char, 60u);
  EXPECT_EQ(chunks[1].start_char, 60u);
  EXPECT_EQ(chunks[1].end_char, 150u);
  EXPECT_EQ(chunks[1].content, block);
  EXPECT_EQ(chunks[1].metadata.overlap_with_previous.value_or(0), 0u);
  for (const auto& chunk : chunks) {
    EXPECT_LE(chunk.content.size(), 100u);
    EXPECT_EQ(count_occurrences(chunk.content, "```") % 2, 0u) << chunk.id;
  }
  for (const auto& warning : report.warnings) {
    EXPECT_EQ(warning.message.find("Protected region"), std::string::npos) << warning.message;
  }
  expect_contiguous(chunks);
  EXPECT_EQ(reconstruct(chunks), doc);
}

TEST_F(ChunkingEngineTest, EmptyDocumentYieldsNoChunks) {
  auto engine = make_engine(ChunkingConfig::defaults());

  EXPECT_TRUE(engine->chunk_document("doc", "").empty());
  EXPECT_TRUE(engine->chunk_document("doc", "").empty());
  EXPECT_TRUE(engine->rechunk_with_boundaries("doc", "", {}).empty());

  auto report = engine->chunk_document_with_report("doc", "");
  EXPECT_TRUE(report.chunks.empty());
  EXPECT_EQ(report.statistics.total_chunks, 0u);
  EXPECT_EQ(report.statistics.total_characters, 0u);
  EXPECT_DOUBLE_EQ(report.statistics.average_chunk_size, 0.0);
}

TEST_F(ChunkingEngineTest, ChunkingIsDeterministic) {
  auto engine = make_engine(make_config(300, 15));
  const std::string doc = make_mixed_document(8);

  auto first = engine->chunk_document("doc", doc);
  auto second = engine->chunk_document("doc", doc);

  EXPECT_EQ(nlohmann::json(first), nlohmann::json(second));
}

TEST_F(ChunkingEngineTest, FullOverlapStillMakesProgress) {
  auto engine = make_engine(make_config(50, 100));
  const std::string text(120, 'a');

  auto chunks = engine->chunk_document("doc", text);

  ASSERT_GT(chunks.size(), 1u);
  EXPECT_EQ(chunks.back().end_char, 120u);
  for (const auto& chunk : chunks) {
    EXPECT_LE(chunk.content.size(), 50u);
  }
  expect_contiguous(chunks);
}

TEST_F(ChunkingEngineTest, ForcedCutsLandOnCodePointBoundaries) {
  auto engine = make_engine(make_config(101, 15));
  // 300 two-byte code points
  const std::string text = repeat("\xC3\xA9", 300);

  auto chunks = engine->chunk_document("doc", text);

  ASSERT_GT(chunks.size(), 1u);
  for (const auto& chunk : chunks) {
    EXPECT_EQ(chunk.start_char % 2, 0u) << chunk.id;
    EXPECT_EQ(chunk.end_char % 2, 0u) << chunk.id;
  }
  EXPECT_EQ(reconstruct(chunks), text);
}

TEST_F(ChunkingEngineTest, ContentHashIsSha256OfChunkText) {
  auto engine = make_engine(ChunkingConfig::defaults());

  auto chunks = engine->chunk_document("doc", "abc");

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].content_hash,
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(chunks[0].content_hash, compute_content_hash("abc"));
}

TEST_F(ChunkingEngineTest, SmartBoundariesEnrichEveryChunk) {
  auto engine = make_engine(make_config(100, 20, true, true), mock_client_);
  EXPECT_CALL(*mock_client_, enrich(_))
      .Times(6)
      .WillRepeatedly(Return(Enrichment{"summary", {"topic"}, {}}));

  auto chunks = engine->chunk_document("doc", std::string(500, 'a'));

  ASSERT_EQ(chunks.size(), 6u);
  for (const auto& chunk : chunks) {
    EXPECT_EQ(chunk.metadata.summary, "summary");
  }
}

TEST_F(ChunkingEngineTest, EnrichmentIsSkippedWithoutSmartBoundaries) {
  auto engine = make_engine(make_config(100, 20, true, false), mock_client_);
  EXPECT_CALL(*mock_client_, enrich(_)).Times(0);

  auto chunks = engine->chunk_document("doc", "Short text.");

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_FALSE(chunks[0].metadata.summary.has_value());
}

TEST_F(ChunkingEngineTest, EnrichmentFailureDoesNotFailChunking) {
  auto engine = make_engine(make_config(100, 20, true, true), mock_client_);
  EXPECT_CALL(*mock_client_, enrich(_)).WillRepeatedly(Throw(EnrichmentError("unavailable")));

  auto chunks = engine->chunk_document("doc", std::string(500, 'a'));

  ASSERT_EQ(chunks.size(), 6u);
  for (const auto& chunk : chunks) {
    EXPECT_FALSE(chunk.metadata.summary.has_value());
    EXPECT_FALSE(chunk.metadata.topics.has_value());
  }
}

TEST_F(ChunkingEngineTest, RechunkWithBoundariesCutsExactly) {
  auto engine = make_engine(ChunkingConfig::defaults());
  const std::string text = "aaaa bbbb cccc";

  auto chunks = engine->rechunk_with_boundaries("doc", text, {10, 5, 5, 0, 99});

  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].content, "aaaa ");
  EXPECT_EQ(chunks[1].content, "bbbb ");
  EXPECT_EQ(chunks[2].content, "cccc");
  EXPECT_EQ(chunks[1].overlap_start, 5u);
  EXPECT_EQ(chunks[1].metadata.overlap_with_previous, 0u);
  EXPECT_EQ(reconstruct(chunks), text);
}

TEST_F(ChunkingEngineTest, PlanSpansMatchesChunks) {
  auto engine = make_engine(make_config(300, 15));
  const std::string doc = make_mixed_document(5);

  auto spans = engine->plan_spans(doc);
  auto chunks = engine->chunk_document("doc", doc);

  ASSERT_EQ(spans.size(), chunks.size());
  for (size_t i = 0; i < spans.size(); ++i) {
    EXPECT_EQ(spans[i].start, chunks[i].start_char);
    EXPECT_EQ(spans[i].end, chunks[i].end_char);
  }
}

}  // namespace docsplit_core
