#include "docsplit_core/chunking/overlap_calculator.hpp"

#include <algorithm>
#include <cmath>

namespace docsplit_core {

size_t OverlapCalculator::overlap_length(size_t chunk_length, int overlap_percentage) {
  if (overlap_percentage <= 0 || chunk_length == 0) {
    return 0;
  }
  const double raw = static_cast<double>(chunk_length) * overlap_percentage / 100.0;
  const auto rounded = static_cast<size_t>(std::llround(raw));
  return std::min(rounded, chunk_length);
}

OverlapRegion OverlapCalculator::overlap(size_t prev_start,
                                         size_t prev_end,
                                         size_t next_target_start,
                                         int overlap_percentage,
                                         const std::vector<structure::TextRegion>& protected_regions) const {
  const size_t length = overlap_length(prev_end - prev_start, overlap_percentage);
  size_t start = prev_end - length;

  // Regions can nest (a table inside a fence), so keep walking out
  while (const structure::TextRegion* region =
             structure::region_containing(protected_regions, start)) {
    if (region->end >= next_target_start) {
      start = next_target_start;
      break;
    }
    start = region->end;
  }
  return {std::min(start, next_target_start), next_target_start};
}

}  // namespace docsplit_core
