#include "docsplit_core/structure/structure_patterns.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>

namespace docsplit_core::structure {

namespace {

using ViewIterator = std::string_view::const_iterator;

// Calls fn(line, offset) for every '\n'-separated line, including a trailing
// empty line when the text ends with a newline.
template <typename Fn>
void for_each_line(std::string_view text, Fn&& fn) {
  size_t line_start = 0;
  while (true) {
    const size_t newline = text.find('\n', line_start);
    const size_t line_end = newline == std::string_view::npos ? text.size() : newline;
    fn(text.substr(line_start, line_end - line_start), line_start);
    if (newline == std::string_view::npos) {
      break;
    }
    line_start = newline + 1;
  }
}

std::string_view strip_carriage_return(std::string_view line) {
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  return line;
}

std::string_view trim(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(begin, end - begin);
}

bool is_blank(std::string_view text) {
  return trim(text).empty();
}

}  // namespace

StructurePatterns::StructurePatterns()
    : code_fence_("```"),
      heading_(R"(^(#{1,6})\s+(.+)$)"),
      section_start_(R"(^#{1,6}\s)"),
      table_row_(R"(^\|.*\|$)"),
      list_item_(R"(^\s*(?:[-*+]|\d+[.)])\s)"),
      sentence_end_(R"([.!?]\s+)"),
      sentence_run_(R"([.!?]+\s+)") {}

const StructurePatterns& StructurePatterns::markdown() {
  static const StructurePatterns patterns;
  return patterns;
}

bool StructurePatterns::match_heading(std::string_view line, Heading& out) const {
  line = strip_carriage_return(line);
  std::match_results<ViewIterator> match;
  if (!std::regex_match(line.begin(), line.end(), match, heading_)) {
    return false;
  }
  out.level = static_cast<int>(match[1].length());
  out.text = std::string(trim(std::string_view(&*match[2].first, match[2].length())));
  return true;
}

bool StructurePatterns::is_section_start(std::string_view line) const {
  line = strip_carriage_return(line);
  return std::regex_search(line.begin(), line.end(), section_start_);
}

bool StructurePatterns::is_table_row(std::string_view line) const {
  const std::string_view trimmed = trim(line);
  return std::regex_match(trimmed.begin(), trimmed.end(), table_row_);
}

bool StructurePatterns::is_list_item(std::string_view line) const {
  line = strip_carriage_return(line);
  return std::regex_search(line.begin(), line.end(), list_item_);
}

std::vector<TextRegion> find_code_blocks(std::string_view text, const StructurePatterns& patterns) {
  std::vector<TextRegion> blocks;
  const std::string& fence = patterns.code_fence();

  size_t open = text.find(fence);
  while (open != std::string_view::npos) {
    const size_t close = text.find(fence, open + fence.size());
    if (close == std::string_view::npos) {
      break;
    }
    blocks.push_back({open, close + fence.size()});
    open = text.find(fence, close + fence.size());
  }
  return blocks;
}

std::vector<TextRegion> find_tables(std::string_view text, const StructurePatterns& patterns) {
  std::vector<TextRegion> tables;
  bool in_table = false;
  size_t table_start = 0;

  for_each_line(text, [&](std::string_view line, size_t offset) {
    const bool is_row = patterns.is_table_row(line);
    if (is_row && !in_table) {
      in_table = true;
      table_start = offset;
    } else if (!is_row && in_table) {
      in_table = false;
      tables.push_back({table_start, offset});
    }
  });

  if (in_table) {
    tables.push_back({table_start, text.size()});
  }
  return tables;
}

std::vector<TextRegion> find_protected_regions(std::string_view text,
                                               const StructurePatterns& patterns) {
  std::vector<TextRegion> regions = find_code_blocks(text, patterns);
  std::vector<TextRegion> tables = find_tables(text, patterns);
  regions.insert(regions.end(), tables.begin(), tables.end());
  std::sort(regions.begin(), regions.end(), [](const TextRegion& a, const TextRegion& b) {
    return a.start < b.start || (a.start == b.start && a.end < b.end);
  });
  return regions;
}

const TextRegion* region_containing(const std::vector<TextRegion>& regions, size_t position) {
  for (const auto& region : regions) {
    if (region.contains_strictly(position)) {
      return &region;
    }
  }
  return nullptr;
}

std::vector<Heading> extract_headings(std::string_view text, const StructurePatterns& patterns) {
  std::vector<Heading> headings;
  const std::vector<TextRegion> code_blocks = find_code_blocks(text, patterns);

  for_each_line(text, [&](std::string_view line, size_t offset) {
    // `# comment` inside a fenced block is code, not a heading
    const bool in_code = std::any_of(code_blocks.begin(), code_blocks.end(),
                                     [offset](const TextRegion& block) {
                                       return block.start <= offset && offset < block.end;
                                     });
    Heading heading;
    if (!in_code && patterns.match_heading(line, heading)) {
      headings.push_back(std::move(heading));
    }
  });
  return headings;
}

bool has_code_blocks(std::string_view text, const StructurePatterns& patterns) {
  return !find_code_blocks(text, patterns).empty();
}

bool has_tables(std::string_view text, const StructurePatterns& patterns) {
  return !find_tables(text, patterns).empty();
}

bool has_lists(std::string_view text, const StructurePatterns& patterns) {
  bool found = false;
  for_each_line(text, [&](std::string_view line, size_t) {
    if (!found && patterns.is_list_item(line)) {
      found = true;
    }
  });
  return found;
}

size_t count_words(std::string_view text) {
  size_t words = 0;
  bool in_word = false;
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      in_word = false;
    } else if (!in_word) {
      in_word = true;
      ++words;
    }
  }
  return words;
}

size_t count_sentences(std::string_view text, const StructurePatterns& patterns) {
  std::regex_iterator<ViewIterator> it(text.begin(), text.end(), patterns.sentence_run());
  const std::regex_iterator<ViewIterator> end;
  return static_cast<size_t>(std::distance(it, end)) + 1;
}

size_t count_paragraphs(std::string_view text) {
  size_t paragraphs = 0;
  size_t segment_start = 0;
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '\n' && i + 1 < text.size() && text[i + 1] == '\n') {
      if (!is_blank(text.substr(segment_start, i - segment_start))) {
        ++paragraphs;
      }
      while (i < text.size() && text[i] == '\n') {
        ++i;
      }
      segment_start = i;
    } else {
      ++i;
    }
  }
  if (!is_blank(text.substr(segment_start))) {
    ++paragraphs;
  }
  return paragraphs;
}

size_t floor_code_point(std::string_view text, size_t from, size_t position) {
  if (position >= text.size() || position <= from) {
    return position;
  }
  const char* it = text.data() + from;
  const char* const target = text.data() + position;
  const char* const end = text.data() + text.size();
  const char* last = it;
  try {
    while (it < target) {
      last = it;
      utf8::next(it, end);
    }
  } catch (const utf8::exception&) {
    return position;
  }
  return it == target ? position : static_cast<size_t>(last - text.data());
}

size_t ceil_code_point(std::string_view text, size_t from, size_t position) {
  if (position >= text.size() || position <= from) {
    return position;
  }
  const char* it = text.data() + from;
  const char* const target = text.data() + position;
  const char* const end = text.data() + text.size();
  try {
    while (it < target) {
      utf8::next(it, end);
    }
  } catch (const utf8::exception&) {
    return position;
  }
  return static_cast<size_t>(it - text.data());
}

}  // namespace docsplit_core::structure
