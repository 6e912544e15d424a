#include "docsplit_core/types.hpp"

namespace docsplit_core {

std::string to_string(BoundaryKind kind) {
  switch (kind) {
    case BoundaryKind::Section:
      return "section";
    case BoundaryKind::Paragraph:
      return "paragraph";
    case BoundaryKind::Sentence:
      return "sentence";
    default:
      return "forced";
  }
}

BoundaryKind boundary_kind_from_string(const std::string& str) {
  if (str == "section")
    return BoundaryKind::Section;
  if (str == "paragraph")
    return BoundaryKind::Paragraph;
  if (str == "sentence")
    return BoundaryKind::Sentence;
  return BoundaryKind::Forced;
}

std::string make_chunk_id(const std::string& document_id, size_t index) {
  return document_id + "-chunk-" + std::to_string(index);
}

}  // namespace docsplit_core
