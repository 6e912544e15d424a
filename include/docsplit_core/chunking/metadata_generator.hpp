#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "docsplit_core/llm/enrichment_client.hpp"
#include "docsplit_core/structure/structure_patterns.hpp"
#include "docsplit_core/types/chunk.hpp"

namespace docsplit_core {

struct ChunkNeighbors {
  std::optional<std::string> previous_chunk_id;
  std::optional<std::string> next_chunk_id;
  std::optional<size_t> overlap_with_previous;
  std::optional<size_t> overlap_with_next;
};

/**
 * @class MetadataGenerator
 * @brief Structural, statistical and (optionally) semantic metadata for chunks.
 *
 * Structural fields are pure functions of the chunk text. Semantic fields
 * come from the injected EnrichmentClient; any failure there leaves them
 * unset and is never propagated.
 */
class MetadataGenerator {
 public:
  /**
   * @param patterns Pattern table, must outlive the generator.
   * @param enrichment Capability to call; NoopEnrichmentClient when absent.
   * @param inter_call_delay Pause between consecutive enrichment calls.
   */
  MetadataGenerator(const structure::StructurePatterns& patterns,
                    EnrichmentClientPtr enrichment,
                    std::chrono::milliseconds inter_call_delay = std::chrono::milliseconds(100));

  // Metadata for one chunk without enrichment.
  ChunkMetadata generate_basic(const std::string& chunk_content,
                               const std::string& document_id,
                               size_t chunk_index,
                               size_t total_chunks,
                               size_t start_position,
                               size_t end_position,
                               const ChunkNeighbors& neighbors) const;

  // Metadata for one chunk, enriched when `enrich` is true and the call succeeds.
  ChunkMetadata generate(const std::string& chunk_content,
                         const std::string& document_id,
                         size_t chunk_index,
                         size_t total_chunks,
                         size_t start_position,
                         size_t end_position,
                         const ChunkNeighbors& neighbors,
                         bool enrich) const;

  /**
   * @brief Enriches every chunk in order, pausing inter_call_delay between calls.
   * @return Number of chunks that received semantic fields.
   */
  size_t enrich_all(std::vector<DocumentChunk>& chunks) const;

  // Sets summary/topics/entities on success; returns false otherwise.
  bool apply_enrichment(const std::string& chunk_content, ChunkMetadata& metadata) const;

 private:
  enum class Outcome { Applied, Declined, Failed };

  Outcome try_enrich(const std::string& chunk_content, ChunkMetadata& metadata) const;

  const structure::StructurePatterns& patterns_;
  EnrichmentClientPtr enrichment_;
  std::chrono::milliseconds inter_call_delay_;
};

}  // namespace docsplit_core
