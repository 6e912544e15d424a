#pragma once

#include <string>
#include <vector>

#include "docsplit_core/chunking/chunking_engine.hpp"
#include "docsplit_core/types/chunk.hpp"

namespace docsplit_core {

class ChunkAdjustmentError : public std::exception {
 public:
  explicit ChunkAdjustmentError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct ValidationResult {
  bool valid;
  std::vector<std::string> errors;
};

/**
 * @class ChunkAdjustmentManager
 * @brief Manual edits on an already chunked document.
 *
 * Every edit works on chunk spans over the original text and rebuilds ids,
 * indices, navigation, overlap fields and metadata afterwards. Semantic
 * metadata survives only on chunks whose span did not change.
 */
class ChunkAdjustmentManager {
 public:
  ChunkAdjustmentManager(const ChunkingEngine& engine,
                         std::vector<DocumentChunk> chunks,
                         std::string original_text,
                         std::string document_id);

  /**
   * @brief Splits a chunk in two near split_offset (relative to the chunk).
   *
   * The offset is moved to the best natural boundary inside the chunk text.
   * @throw ChunkAdjustmentError on an unknown id or when the resulting split
   *        would leave one side empty.
   */
  const std::vector<DocumentChunk>& split_chunk(const std::string& chunk_id, size_t split_offset);

  /**
   * @brief Merges two adjacent chunks into one.
   * @throw ChunkAdjustmentError if either id is unknown, the chunks are not
   *        adjacent, or the merged chunk would exceed max_chunk_size.
   */
  const std::vector<DocumentChunk>& merge_chunks(const std::string& first_id,
                                                 const std::string& second_id);

  /**
   * @brief Moves the end of a chunk near new_end_offset (relative to the chunk).
   *
   * The following chunk starts where this one now ends.
   * @throw ChunkAdjustmentError for the last chunk or an out-of-range result.
   */
  const std::vector<DocumentChunk>& adjust_boundary(const std::string& chunk_id,
                                                    size_t new_end_offset);

  ValidationResult validate_chunks() const;

  const std::vector<DocumentChunk>& chunks() const {
    return chunks_;
  }

  // Pretty-printed JSON array of the current chunks.
  std::string export_chunks() const;

 private:
  const ChunkingEngine& engine_;
  std::vector<DocumentChunk> chunks_;
  std::string original_text_;
  std::string document_id_;

  size_t index_of(const std::string& chunk_id) const;
  std::vector<ChunkSpan> current_spans() const;
  void rebuild(const std::vector<ChunkSpan>& spans);
};

}  // namespace docsplit_core
