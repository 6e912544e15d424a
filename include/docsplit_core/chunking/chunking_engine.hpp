#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "docsplit_core/chunking/boundary_detector.hpp"
#include "docsplit_core/chunking/metadata_generator.hpp"
#include "docsplit_core/chunking/overlap_calculator.hpp"
#include "docsplit_core/chunking/statistics_aggregator.hpp"
#include "docsplit_core/chunking_config.hpp"
#include "docsplit_core/llm/enrichment_client.hpp"
#include "docsplit_core/structure/structure_patterns.hpp"
#include "docsplit_core/types.hpp"

namespace docsplit_core {

/**
 * @class ChunkingEngine
 * @brief Splits documents into bounded, overlapping chunks.
 *
 * The engine keeps no per-document state: one instance can chunk any number
 * of documents, concurrently if the injected EnrichmentClient allows it.
 *
 * An empty document always produces zero chunks.
 */
class ChunkingEngine {
 public:
  /**
   * @param config Validated chunking settings.
   * @param enrichment Used only when config.use_smart_boundaries() is set.
   *        nullptr means no enrichment.
   * @param patterns Pattern table, must outlive the engine.
   * @param enrichment_delay Pause between enrichment calls.
   */
  explicit ChunkingEngine(ChunkingConfig config,
                          EnrichmentClientPtr enrichment = nullptr,
                          const structure::StructurePatterns& patterns =
                              structure::StructurePatterns::markdown(),
                          std::chrono::milliseconds enrichment_delay = std::chrono::milliseconds(100));

  ChunkingEngine(const ChunkingEngine&) = delete;
  ChunkingEngine& operator=(const ChunkingEngine&) = delete;

  std::vector<DocumentChunk> chunk_document(const std::string& document_id,
                                            const std::string& content) const;

  // Chunks plus statistics, ambiguity warnings and timing.
  ChunkingReport chunk_document_with_report(const std::string& document_id,
                                            const std::string& content) const;

  /**
   * @brief The boundary walk alone: one span per chunk, in order.
   *
   * Every span is at most effective_budget() long, starts strictly after the
   * previous one and ends at or after the previous end. The last span ends at
   * content.size().
   */
  std::vector<ChunkSpan> plan_spans(std::string_view content,
                                    std::vector<StructuralAmbiguityWarning>* warnings = nullptr) const;

  // Builds chunks (ids, overlap fields, metadata, navigation) for given spans.
  std::vector<DocumentChunk> assemble_chunks(const std::string& document_id,
                                             const std::string& content,
                                             const std::vector<ChunkSpan>& spans,
                                             bool enrich) const;

  // Cuts at caller-chosen positions, without overlap. Positions outside
  // (0, content.size()) and duplicates are ignored.
  std::vector<DocumentChunk> rechunk_with_boundaries(const std::string& document_id,
                                                     const std::string& content,
                                                     std::vector<size_t> boundaries) const;

  const ChunkingConfig& config() const {
    return config_;
  }
  const BoundaryDetector& boundary_detector() const {
    return detector_;
  }

 private:
  ChunkingConfig config_;
  const structure::StructurePatterns& patterns_;
  BoundaryDetector detector_;
  OverlapCalculator overlap_calculator_;
  MetadataGenerator metadata_generator_;
};

}  // namespace docsplit_core
