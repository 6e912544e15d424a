#pragma once

#include <optional>
#include <vector>

#include "docsplit_core/types/chunk.hpp"
#include "docsplit_core/types/stats.hpp"

namespace docsplit_core {

/**
 * @class StatisticsAggregator
 * @brief Rolls a chunk list up into corpus-level statistics.
 *
 * An empty list yields an all-zero ChunkingStats.
 */
class StatisticsAggregator {
 public:
  StatisticsAggregator() = default;

  // With a minimum size, chunks shorter than it are counted as undersized
  // (a document that became a single chunk is never undersized).
  explicit StatisticsAggregator(size_t min_chunk_size) : min_chunk_size_(min_chunk_size) {}

  ChunkingStats aggregate(const std::vector<DocumentChunk>& chunks) const;

 private:
  std::optional<size_t> min_chunk_size_;
};

}  // namespace docsplit_core
