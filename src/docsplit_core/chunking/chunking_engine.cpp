#include "docsplit_core/chunking/chunking_engine.hpp"

#include <algorithm>
#include <iostream>

#include "docsplit_core/content_hash.hpp"

namespace docsplit_core {

using structure::TextRegion;

ChunkingEngine::ChunkingEngine(ChunkingConfig config,
                               EnrichmentClientPtr enrichment,
                               const structure::StructurePatterns& patterns,
                               std::chrono::milliseconds enrichment_delay)
    : config_(std::move(config)),
      patterns_(patterns),
      detector_(patterns, config_.preserve_structure()),
      metadata_generator_(patterns, std::move(enrichment), enrichment_delay) {}

std::vector<ChunkSpan> ChunkingEngine::plan_spans(
    std::string_view content, std::vector<StructuralAmbiguityWarning>* warnings) const {
  std::vector<ChunkSpan> spans;
  const size_t length = content.size();
  const size_t budget = config_.effective_budget();

  if (length == 0) {
    return spans;
  }
  if (length <= budget) {
    spans.push_back({0, length});
    return spans;
  }

  std::vector<TextRegion> regions;
  if (config_.preserve_structure()) {
    regions = structure::find_protected_regions(content, patterns_);
  }

  size_t start = 0;
  size_t previous_end = 0;
  while (start < length) {
    if (length - start <= budget) {
      spans.push_back({start, length});
      break;
    }

    const size_t ceiling = start + budget;
    const size_t floor = std::max(start, previous_end);

    // The overlap pulled this chunk in front of a region the previous chunk
    // stopped at. A region that fits the budget becomes its own chunk.
    const TextRegion* fitting_region = nullptr;
    if (const TextRegion* region = structure::region_containing(regions, ceiling)) {
      if (region->start >= start && region->start <= floor &&
          region->end - region->start <= budget) {
        fitting_region = region;
      }
    }

    size_t end = 0;
    if (fitting_region != nullptr) {
      start = fitting_region->start;
      end = fitting_region->end;
    } else {
      const ChunkBoundary boundary = detector_.find_boundary(
          content, ceiling, BoundaryDetector::DEFAULT_SEARCH_WINDOW, floor, ceiling, regions);
      end = boundary.position;
      if (boundary.kind == BoundaryKind::Forced && boundary.confidence == 0.0) {
        end = structure::floor_code_point(content, start, end);
        if (end <= floor) {
          end = ceiling;
        }

        std::string message;
        if (const TextRegion* region = structure::region_containing(regions, ceiling)) {
          message = "Protected region [" + std::to_string(region->start) + ", " +
                    std::to_string(region->end) + ") exceeds the chunk budget of " +
                    std::to_string(budget) + " bytes and was split";
        } else {
          message = "No structural boundary within " +
                    std::to_string(BoundaryDetector::DEFAULT_SEARCH_WINDOW) +
                    " bytes; chunk cut mid-text";
        }
        std::cerr << "Warning: " << message << " (position " << end << ")" << std::endl;
        if (warnings) {
          warnings->push_back({end, std::move(message)});
        }
      }
    }

    spans.push_back({start, end});
    if (end >= length) {
      break;
    }

    const OverlapRegion overlap =
        overlap_calculator_.overlap(start, end, end, config_.overlap_percentage(), regions);
    size_t next_start = structure::ceil_code_point(content, start, overlap.start);
    if (next_start <= start) {
      // Full overlap would never advance
      next_start = std::min(end, structure::ceil_code_point(content, start, start + 1));
    }

    previous_end = end;
    start = std::min(next_start, end);
  }

  return spans;
}

std::vector<DocumentChunk> ChunkingEngine::assemble_chunks(const std::string& document_id,
                                                           const std::string& content,
                                                           const std::vector<ChunkSpan>& spans,
                                                           bool enrich) const {
  std::vector<DocumentChunk> chunks;
  chunks.reserve(spans.size());
  const size_t total = spans.size();

  for (size_t i = 0; i < total; ++i) {
    const ChunkSpan& span = spans[i];

    DocumentChunk chunk;
    chunk.id = make_chunk_id(document_id, i);
    chunk.document_id = document_id;
    chunk.content = content.substr(span.start, span.length());
    chunk.content_hash = compute_content_hash(chunk.content);
    chunk.index = i;
    chunk.start_char = span.start;
    chunk.end_char = span.end;

    ChunkNeighbors neighbors;
    if (i > 0) {
      const size_t shared_until = std::clamp(spans[i - 1].end, span.start, span.end);
      chunk.overlap_start = shared_until;
      neighbors.previous_chunk_id = make_chunk_id(document_id, i - 1);
      neighbors.overlap_with_previous = shared_until - span.start;
    }
    if (i + 1 < total) {
      const size_t shared_from = std::clamp(spans[i + 1].start, span.start, span.end);
      chunk.overlap_end = shared_from;
      neighbors.next_chunk_id = make_chunk_id(document_id, i + 1);
      neighbors.overlap_with_next = span.end - shared_from;
    }

    chunk.metadata = metadata_generator_.generate_basic(chunk.content, document_id, i, total,
                                                        span.start, span.end, neighbors);
    chunks.push_back(std::move(chunk));
  }

  if (enrich && !chunks.empty()) {
    metadata_generator_.enrich_all(chunks);
  }
  return chunks;
}

std::vector<DocumentChunk> ChunkingEngine::chunk_document(const std::string& document_id,
                                                          const std::string& content) const {
  return chunk_document_with_report(document_id, content).chunks;
}

ChunkingReport ChunkingEngine::chunk_document_with_report(const std::string& document_id,
                                                          const std::string& content) const {
  const auto started = std::chrono::steady_clock::now();

  ChunkingReport report;
  report.document_id = document_id;

  const std::vector<ChunkSpan> spans = plan_spans(content, &report.warnings);
  report.chunks = assemble_chunks(document_id, content, spans, config_.use_smart_boundaries());
  report.statistics = StatisticsAggregator(config_.min_chunk_size()).aggregate(report.chunks);

  report.processing_time = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  return report;
}

std::vector<DocumentChunk> ChunkingEngine::rechunk_with_boundaries(
    const std::string& document_id, const std::string& content, std::vector<size_t> boundaries) const {
  std::sort(boundaries.begin(), boundaries.end());
  boundaries.erase(std::unique(boundaries.begin(), boundaries.end()), boundaries.end());

  std::vector<ChunkSpan> spans;
  size_t last_position = 0;
  for (const size_t boundary : boundaries) {
    if (boundary == 0 || boundary >= content.size()) {
      continue;
    }
    spans.push_back({last_position, boundary});
    last_position = boundary;
  }
  if (last_position < content.size()) {
    spans.push_back({last_position, content.size()});
  }

  return assemble_chunks(document_id, content, spans, false);
}

}  // namespace docsplit_core
