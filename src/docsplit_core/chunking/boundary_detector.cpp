#include "docsplit_core/chunking/boundary_detector.hpp"

#include <algorithm>
#include <regex>

namespace docsplit_core {

using structure::TextRegion;

BoundaryDetector::BoundaryDetector(const structure::StructurePatterns& patterns,
                                   bool preserve_structure)
    : patterns_(patterns), preserve_structure_(preserve_structure) {}

double BoundaryDetector::score(const ChunkBoundary& candidate, size_t target_position) {
  const double distance = candidate.position > target_position
                              ? static_cast<double>(candidate.position - target_position)
                              : static_cast<double>(target_position - candidate.position);
  return candidate.confidence * 1000.0 - distance;
}

std::vector<ChunkBoundary> BoundaryDetector::collect_candidates(std::string_view document,
                                                                size_t target_position,
                                                                size_t search_window) const {
  std::vector<ChunkBoundary> candidates;
  const size_t search_start =
      target_position > search_window ? target_position - search_window : 0;
  const size_t search_end = std::min(document.size(), target_position + search_window);
  if (search_start >= search_end) {
    return candidates;
  }
  const std::string_view window = document.substr(search_start, search_end - search_start);

  // Sections: the start of a heading line, the window's first line included
  // when a newline sits right before it
  size_t line_start = window.find('\n');
  if (search_start > 0 && document[search_start - 1] == '\n') {
    line_start = 0;
  } else if (line_start != std::string_view::npos) {
    ++line_start;
  }
  while (line_start != std::string_view::npos && line_start < window.size()) {
    const size_t line_end = window.find('\n', line_start);
    const std::string_view line = window.substr(
        line_start, line_end == std::string_view::npos ? std::string_view::npos : line_end - line_start);
    if (patterns_.is_section_start(line)) {
      candidates.push_back(
          {search_start + line_start, BoundaryKind::Section, SECTION_CONFIDENCE});
    }
    line_start = line_end == std::string_view::npos ? line_end : line_end + 1;
  }

  // Paragraphs: right after a blank line
  size_t blank = window.find("\n\n");
  while (blank != std::string_view::npos) {
    candidates.push_back({search_start + blank + 2, BoundaryKind::Paragraph, PARAGRAPH_CONFIDENCE});
    blank = window.find("\n\n", blank + 2);
  }

  // Sentences: after terminal punctuation and the whitespace that follows it
  using ViewIterator = std::string_view::const_iterator;
  std::regex_iterator<ViewIterator> it(window.begin(), window.end(), patterns_.sentence_end());
  const std::regex_iterator<ViewIterator> end;
  for (; it != end; ++it) {
    const auto& match = *it;
    const size_t after = static_cast<size_t>(match.position(0) + match.length(0));
    candidates.push_back({search_start + after, BoundaryKind::Sentence, SENTENCE_CONFIDENCE});
  }

  return candidates;
}

ChunkBoundary BoundaryDetector::find_boundary(std::string_view document,
                                              size_t target_position,
                                              size_t search_window) const {
  std::vector<TextRegion> regions;
  if (preserve_structure_) {
    regions = structure::find_protected_regions(document, patterns_);
  }
  return find_boundary(document, target_position, search_window, 0,
                       std::numeric_limits<size_t>::max(), regions);
}

ChunkBoundary BoundaryDetector::find_boundary(std::string_view document,
                                              size_t target_position,
                                              size_t search_window,
                                              size_t floor,
                                              size_t ceiling,
                                              const std::vector<TextRegion>& protected_regions) const {
  static const std::vector<TextRegion> no_regions;
  const std::vector<TextRegion>& regions = preserve_structure_ ? protected_regions : no_regions;

  if (preserve_structure_) {
    // Never break in the middle of a code block or table
    if (const TextRegion* region = structure::region_containing(regions, target_position)) {
      if (region->end <= ceiling) {
        return {region->end, BoundaryKind::Forced, 1.0};
      }
      if (region->start > floor) {
        return {region->start, BoundaryKind::Forced, 1.0};
      }
      // The region alone exceeds the allowed span; fall through and cut it.
    }
  }

  std::vector<ChunkBoundary> candidates =
      collect_candidates(document, target_position, search_window);

  const ChunkBoundary* best = nullptr;
  double best_score = 0.0;
  for (const auto& candidate : candidates) {
    if (candidate.position <= floor || candidate.position > ceiling) {
      continue;
    }
    if (structure::region_containing(regions, candidate.position) != nullptr) {
      continue;
    }
    const double candidate_score = score(candidate, target_position);
    if (best == nullptr || candidate_score > best_score) {
      best = &candidate;
      best_score = candidate_score;
    }
  }

  if (best == nullptr || best->position > target_position + search_window) {
    return {target_position, BoundaryKind::Forced, 0.0};
  }
  return *best;
}

}  // namespace docsplit_core
