#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "docsplit_core/types/chunk.hpp"

namespace docsplit_core {

struct ChunkingStats {
  size_t total_chunks = 0;
  size_t total_characters = 0;
  size_t total_words = 0;
  double average_chunk_size = 0.0;
  size_t min_chunk_size = 0;
  size_t max_chunk_size = 0;
  size_t total_overlap = 0;
  double average_overlap = 0.0;
  size_t heading_count = 0;
  size_t code_block_count = 0;
  size_t table_count = 0;
  size_t list_count = 0;
  size_t undersized_chunks = 0;
};

// Raised (collected, never thrown) when the boundary search had to cut a
// chunk at an arbitrary position because nothing structural was nearby.
struct StructuralAmbiguityWarning {
  size_t position;
  std::string message;
};

struct ChunkingReport {
  std::string document_id;
  std::vector<DocumentChunk> chunks;
  ChunkingStats statistics;
  std::vector<StructuralAmbiguityWarning> warnings;
  std::chrono::milliseconds processing_time{0};
};

}  // namespace docsplit_core
