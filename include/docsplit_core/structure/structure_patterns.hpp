#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "docsplit_core/types/chunk.hpp"

namespace docsplit_core::structure {

// Half-open range [start, end) of a document.
struct TextRegion {
  size_t start;
  size_t end;

  bool contains_strictly(size_t position) const {
    return start < position && position < end;
  }
  bool operator==(const TextRegion&) const = default;
};

/**
 * @class StructurePatterns
 * @brief The markdown pattern table shared by boundary detection and
 * metadata generation.
 *
 * Built once and passed by reference. Every pattern is matched against a
 * single line, never against a whole document.
 */
class StructurePatterns {
 public:
  StructurePatterns();

  // Process-wide instance for the default markdown dialect.
  static const StructurePatterns& markdown();

  const std::string& code_fence() const {
    return code_fence_;
  }

  // `## Title` -> level 2, "Title"
  bool match_heading(std::string_view line, Heading& out) const;
  // Line that opens a section: 1-6 '#' followed by whitespace.
  bool is_section_start(std::string_view line) const;
  // `| a | b |` once surrounding whitespace is trimmed.
  bool is_table_row(std::string_view line) const;
  // `- item`, `* item`, `+ item`, `1. item`, `2) item`
  bool is_list_item(std::string_view line) const;

  const std::regex& sentence_end() const {
    return sentence_end_;
  }
  const std::regex& sentence_run() const {
    return sentence_run_;
  }

 private:
  std::string code_fence_;
  std::regex heading_;
  std::regex section_start_;
  std::regex table_row_;
  std::regex list_item_;
  std::regex sentence_end_;
  std::regex sentence_run_;
};

// --- Protected regions ---

// Pairs of ``` delimiters, in order. An unmatched opening fence yields nothing.
std::vector<TextRegion> find_code_blocks(std::string_view text, const StructurePatterns& patterns);

// Runs of consecutive table rows. A region ends at the start of the first
// non-table line, or at the end of the text.
std::vector<TextRegion> find_tables(std::string_view text, const StructurePatterns& patterns);

// Code blocks and tables, sorted by start.
std::vector<TextRegion> find_protected_regions(std::string_view text,
                                               const StructurePatterns& patterns);

// The region that strictly contains position, or nullptr.
const TextRegion* region_containing(const std::vector<TextRegion>& regions, size_t position);

// --- Structural features ---

std::vector<Heading> extract_headings(std::string_view text, const StructurePatterns& patterns);
bool has_code_blocks(std::string_view text, const StructurePatterns& patterns);
bool has_tables(std::string_view text, const StructurePatterns& patterns);
bool has_lists(std::string_view text, const StructurePatterns& patterns);

// --- Counts ---

size_t count_words(std::string_view text);
// Runs of sentence punctuation followed by whitespace, plus one.
size_t count_sentences(std::string_view text, const StructurePatterns& patterns);
// Non-blank segments separated by one or more blank lines.
size_t count_paragraphs(std::string_view text);

// --- UTF-8 alignment ---
// Both walk code points forward from `from`, which must itself be a code point
// start. Invalid UTF-8 leaves `position` untouched.

// Last code point start <= position.
size_t floor_code_point(std::string_view text, size_t from, size_t position);
// First code point start >= position.
size_t ceil_code_point(std::string_view text, size_t from, size_t position);

}  // namespace docsplit_core::structure
