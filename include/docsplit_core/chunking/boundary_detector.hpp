#pragma once

#include <cstddef>
#include <limits>
#include <string_view>
#include <vector>

#include "docsplit_core/structure/structure_patterns.hpp"
#include "docsplit_core/types/chunk.hpp"

namespace docsplit_core {

/**
 * @class BoundaryDetector
 * @brief Chooses where a chunk should end.
 *
 * Stateless apart from its references; safe to share between threads.
 */
class BoundaryDetector {
 public:
  static constexpr size_t DEFAULT_SEARCH_WINDOW = 200;

  static constexpr double SECTION_CONFIDENCE = 1.0;
  static constexpr double PARAGRAPH_CONFIDENCE = 0.8;
  static constexpr double SENTENCE_CONFIDENCE = 0.6;

  /**
   * @param patterns Pattern table, must outlive the detector.
   * @param preserve_structure When false, code blocks and tables are not
   *        protected and candidates inside them are allowed.
   */
  explicit BoundaryDetector(const structure::StructurePatterns& patterns,
                            bool preserve_structure = true);

  /**
   * @brief Finds the best place to end a chunk near target_position.
   *
   * A target strictly inside a code block or table is forced to the end of
   * that region with confidence 1.0. Otherwise section (1.0), paragraph (0.8)
   * and sentence (0.6) boundaries within [target - window, target + window]
   * are scored as confidence * 1000 - distance; the highest score wins and
   * ties go to the earliest candidate in scan order. With no candidate the
   * result is {target_position, Forced, 0.0}.
   */
  ChunkBoundary find_boundary(std::string_view document,
                              size_t target_position,
                              size_t search_window = DEFAULT_SEARCH_WINDOW) const;

  /**
   * @brief Same search, restricted to positions in (floor, ceiling].
   *
   * Used by the chunking loop so a chunk never ends past its budget. A
   * protected region that cannot end before the ceiling is cut before its
   * start instead when that start lies above the floor.
   *
   * @param regions Protected regions of the whole document, sorted by start,
   *        as returned by structure::find_protected_regions. Ignored when
   *        structure is not preserved.
   */
  ChunkBoundary find_boundary(std::string_view document,
                              size_t target_position,
                              size_t search_window,
                              size_t floor,
                              size_t ceiling,
                              const std::vector<structure::TextRegion>& regions) const;

  // Every candidate in the window, in scan order: sections, paragraphs, sentences.
  std::vector<ChunkBoundary> collect_candidates(std::string_view document,
                                                size_t target_position,
                                                size_t search_window) const;

  static double score(const ChunkBoundary& candidate, size_t target_position);

 private:
  const structure::StructurePatterns& patterns_;
  bool preserve_structure_;
};

}  // namespace docsplit_core
