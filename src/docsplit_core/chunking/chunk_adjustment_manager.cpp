#include "docsplit_core/chunking/chunk_adjustment_manager.hpp"

#include <algorithm>

#include "docsplit_core/serialization/json.hpp"

namespace docsplit_core {

ChunkAdjustmentManager::ChunkAdjustmentManager(const ChunkingEngine& engine,
                                               std::vector<DocumentChunk> chunks,
                                               std::string original_text,
                                               std::string document_id)
    : engine_(engine),
      chunks_(std::move(chunks)),
      original_text_(std::move(original_text)),
      document_id_(std::move(document_id)) {}

size_t ChunkAdjustmentManager::index_of(const std::string& chunk_id) const {
  auto it = std::find_if(chunks_.begin(), chunks_.end(),
                         [&](const DocumentChunk& chunk) { return chunk.id == chunk_id; });
  if (it == chunks_.end()) {
    throw ChunkAdjustmentError("Chunk " + chunk_id + " not found");
  }
  return static_cast<size_t>(it - chunks_.begin());
}

std::vector<ChunkSpan> ChunkAdjustmentManager::current_spans() const {
  std::vector<ChunkSpan> spans;
  spans.reserve(chunks_.size());
  for (const auto& chunk : chunks_) {
    spans.push_back({chunk.start_char, chunk.end_char});
  }
  return spans;
}

void ChunkAdjustmentManager::rebuild(const std::vector<ChunkSpan>& spans) {
  std::vector<DocumentChunk> rebuilt =
      engine_.assemble_chunks(document_id_, original_text_, spans, false);

  for (auto& chunk : rebuilt) {
    auto previous = std::find_if(chunks_.begin(), chunks_.end(), [&](const DocumentChunk& old) {
      return old.start_char == chunk.start_char && old.end_char == chunk.end_char;
    });
    if (previous != chunks_.end()) {
      chunk.metadata.summary = previous->metadata.summary;
      chunk.metadata.topics = previous->metadata.topics;
      chunk.metadata.entities = previous->metadata.entities;
    }
  }
  chunks_ = std::move(rebuilt);
}

const std::vector<DocumentChunk>& ChunkAdjustmentManager::split_chunk(const std::string& chunk_id,
                                                                      size_t split_offset) {
  const size_t index = index_of(chunk_id);
  const DocumentChunk& chunk = chunks_[index];

  const ChunkBoundary boundary =
      engine_.boundary_detector().find_boundary(chunk.content, split_offset);
  const size_t split_at = boundary.position;
  if (split_at == 0 || split_at >= chunk.content.size()) {
    throw ChunkAdjustmentError("Split position " + std::to_string(split_at) +
                               " must fall strictly inside chunk " + chunk_id);
  }

  std::vector<ChunkSpan> spans = current_spans();
  const ChunkSpan original = spans[index];
  spans[index] = {original.start, original.start + split_at};
  spans.insert(spans.begin() + static_cast<long>(index) + 1,
               ChunkSpan{original.start + split_at, original.end});

  rebuild(spans);
  return chunks_;
}

const std::vector<DocumentChunk>& ChunkAdjustmentManager::merge_chunks(const std::string& first_id,
                                                                       const std::string& second_id) {
  const size_t a = index_of(first_id);
  const size_t b = index_of(second_id);
  const size_t first = std::min(a, b);
  const size_t second = std::max(a, b);

  if (second - first != 1) {
    throw ChunkAdjustmentError("Chunks must be adjacent to merge");
  }

  std::vector<ChunkSpan> spans = current_spans();
  const ChunkSpan merged{spans[first].start, spans[second].end};
  const size_t limit = engine_.config().max_chunk_size();
  if (merged.length() > limit) {
    throw ChunkAdjustmentError("Merged chunk would exceed maximum size limit (" +
                               std::to_string(merged.length()) + " > " + std::to_string(limit) +
                               ")");
  }

  spans[first] = merged;
  spans.erase(spans.begin() + static_cast<long>(second));

  rebuild(spans);
  return chunks_;
}

const std::vector<DocumentChunk>& ChunkAdjustmentManager::adjust_boundary(
    const std::string& chunk_id, size_t new_end_offset) {
  const size_t index = index_of(chunk_id);
  if (index + 1 >= chunks_.size()) {
    throw ChunkAdjustmentError("Cannot adjust boundary of last chunk");
  }

  const DocumentChunk& chunk = chunks_[index];
  const DocumentChunk& next = chunks_[index + 1];

  const ChunkBoundary boundary = engine_.boundary_detector().find_boundary(
      original_text_, chunk.start_char + new_end_offset);
  const size_t adjusted = boundary.position;

  size_t lower = chunk.start_char;
  if (index > 0) {
    lower = std::max(lower, chunks_[index - 1].end_char);
  }
  if (adjusted <= lower || adjusted >= next.end_char) {
    throw ChunkAdjustmentError("Invalid boundary position " + std::to_string(adjusted));
  }

  std::vector<ChunkSpan> spans = current_spans();
  spans[index].end = adjusted;
  spans[index + 1].start = adjusted;

  rebuild(spans);
  return chunks_;
}

ValidationResult ChunkAdjustmentManager::validate_chunks() const {
  std::vector<std::string> errors;
  const size_t max_size = engine_.config().max_chunk_size();
  const size_t min_size = engine_.config().min_chunk_size();

  for (size_t i = 0; i < chunks_.size(); ++i) {
    const DocumentChunk& chunk = chunks_[i];
    const size_t size = chunk.content.size();
    const bool is_last = i + 1 == chunks_.size();

    if (size > max_size) {
      errors.push_back("Chunk " + std::to_string(i + 1) + " exceeds maximum size (" +
                       std::to_string(size) + " > " + std::to_string(max_size) + ")");
    }
    if (!is_last && size < min_size) {
      errors.push_back("Chunk " + std::to_string(i + 1) + " is below minimum size (" +
                       std::to_string(size) + " < " + std::to_string(min_size) + ")");
    }

    if (chunk.metadata.chunk_index != i || chunk.metadata.total_chunks != chunks_.size()) {
      errors.push_back("Chunk " + std::to_string(i + 1) + " has stale index metadata");
    }

    if (i > 0) {
      const DocumentChunk& previous = chunks_[i - 1];
      if (chunk.start_char > previous.end_char) {
        errors.push_back("Gap detected between chunks " + std::to_string(i) + " and " +
                         std::to_string(i + 1));
      }
      if (chunk.start_char <= previous.start_char) {
        errors.push_back("Chunk " + std::to_string(i + 1) + " does not advance past chunk " +
                         std::to_string(i));
      }
      if (chunk.metadata.previous_chunk_id != previous.id) {
        errors.push_back("Chunk " + std::to_string(i + 1) + " missing previous link");
      }
    }
    if (!is_last && chunk.metadata.next_chunk_id != chunks_[i + 1].id) {
      errors.push_back("Chunk " + std::to_string(i + 1) + " missing next link");
    }
  }

  return {errors.empty(), errors};
}

std::string ChunkAdjustmentManager::export_chunks() const {
  nlohmann::json out = chunks_;
  return out.dump(2);
}

}  // namespace docsplit_core
