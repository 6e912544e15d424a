#include "docsplit_core/chunking/statistics_aggregator.hpp"

#include <algorithm>
#include <limits>

namespace docsplit_core {

ChunkingStats StatisticsAggregator::aggregate(const std::vector<DocumentChunk>& chunks) const {
  ChunkingStats stats;
  if (chunks.empty()) {
    return stats;
  }

  size_t overlap_count = 0;
  stats.min_chunk_size = std::numeric_limits<size_t>::max();

  for (const auto& chunk : chunks) {
    const size_t size = chunk.content.size();
    stats.total_characters += size;
    stats.total_words += chunk.metadata.word_count;
    stats.min_chunk_size = std::min(stats.min_chunk_size, size);
    stats.max_chunk_size = std::max(stats.max_chunk_size, size);
    stats.heading_count += chunk.metadata.headings.size();

    if (chunk.metadata.has_code_blocks)
      stats.code_block_count++;
    if (chunk.metadata.has_tables)
      stats.table_count++;
    if (chunk.metadata.has_lists)
      stats.list_count++;

    if (chunk.metadata.overlap_with_next.has_value()) {
      stats.total_overlap += *chunk.metadata.overlap_with_next;
      overlap_count++;
    }

    if (min_chunk_size_ && chunks.size() > 1 && size < *min_chunk_size_) {
      stats.undersized_chunks++;
    }
  }

  stats.total_chunks = chunks.size();
  stats.average_chunk_size =
      static_cast<double>(stats.total_characters) / static_cast<double>(chunks.size());
  stats.average_overlap = overlap_count > 0 ? static_cast<double>(stats.total_overlap) /
                                                  static_cast<double>(overlap_count)
                                            : 0.0;
  return stats;
}

}  // namespace docsplit_core
