#pragma once

#include <cstddef>
#include <vector>

#include "docsplit_core/structure/structure_patterns.hpp"

namespace docsplit_core {

// Region a chunk shares with its successor: [start, end).
struct OverlapRegion {
  size_t start;
  size_t end;

  size_t length() const {
    return end - start;
  }
};

class OverlapCalculator {
 public:
  // round(chunk_length * percentage / 100), clamped to [0, chunk_length].
  static size_t overlap_length(size_t chunk_length, int overlap_percentage);

  /**
   * @brief Computes where the next chunk starts given the previous span.
   *
   * The next chunk begins overlap_length() bytes before prev_end. When that
   * start lands strictly inside a protected region it is moved forward to the
   * region's end (never past next_target_start), shrinking the overlap rather
   * than reopening a fence or a table.
   *
   * @param prev_start Start of the previous chunk.
   * @param prev_end End of the previous chunk.
   * @param next_target_start Where the next chunk would start with no overlap.
   * @param overlap_percentage 0..100.
   * @param protected_regions Sorted regions that must not be entered.
   */
  OverlapRegion overlap(size_t prev_start,
                        size_t prev_end,
                        size_t next_target_start,
                        int overlap_percentage,
                        const std::vector<structure::TextRegion>& protected_regions = {}) const;
};

}  // namespace docsplit_core
