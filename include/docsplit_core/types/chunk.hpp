#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace docsplit_core {

enum class BoundaryKind { Section, Paragraph, Sentence, Forced };

std::string to_string(BoundaryKind kind);
BoundaryKind boundary_kind_from_string(const std::string& str);

struct ChunkBoundary {
  size_t position;
  BoundaryKind kind;
  double confidence;  // 0..1
};

struct Heading {
  int level;
  std::string text;

  bool operator==(const Heading&) const = default;
};

struct ChunkMetadata {
  // Position
  std::string document_id;
  size_t chunk_index = 0;
  size_t total_chunks = 0;
  size_t start_position = 0;
  size_t end_position = 0;

  // Content counts
  size_t word_count = 0;
  size_t character_count = 0;
  size_t sentence_count = 0;
  size_t paragraph_count = 0;

  // Structure
  std::vector<Heading> headings;
  bool has_code_blocks = false;
  bool has_tables = false;
  bool has_lists = false;

  // Semantic, only present when enrichment succeeded
  std::optional<std::string> summary;
  std::optional<std::vector<std::string>> topics;
  std::optional<std::vector<std::string>> entities;

  // Navigation
  std::optional<std::string> previous_chunk_id;
  std::optional<std::string> next_chunk_id;
  std::optional<size_t> overlap_with_previous;
  std::optional<size_t> overlap_with_next;
};

// A chunk of a source document. Offsets are byte offsets into the source.
//
// overlap_start is set on every chunk but the first: [start_char, overlap_start)
// is shared with the previous chunk. overlap_end is set on every chunk but the
// last: [overlap_end, end_char) is shared with the next chunk.
struct DocumentChunk {
  std::string id;
  std::string document_id;
  std::string content;
  std::string content_hash;
  size_t index = 0;
  size_t start_char = 0;
  size_t end_char = 0;
  std::optional<size_t> overlap_start;
  std::optional<size_t> overlap_end;
  ChunkMetadata metadata;
};

// Half-open span [start, end) of the source document.
struct ChunkSpan {
  size_t start;
  size_t end;

  size_t length() const {
    return end - start;
  }
  bool operator==(const ChunkSpan&) const = default;
};

std::string make_chunk_id(const std::string& document_id, size_t index);

}  // namespace docsplit_core
