#include "docsplit_core/serialization/json.hpp"

namespace docsplit_core {

namespace {

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
  if (value.has_value()) {
    j[key] = *value;
  }
}

}  // namespace

void to_json(nlohmann::json& j, const ChunkBoundary& boundary) {
  j = {{"position", boundary.position},
       {"kind", to_string(boundary.kind)},
       {"confidence", boundary.confidence}};
}

void to_json(nlohmann::json& j, const Heading& heading) {
  j = {{"level", heading.level}, {"text", heading.text}};
}

void to_json(nlohmann::json& j, const ChunkMetadata& metadata) {
  j = {{"document_id", metadata.document_id},
       {"chunk_index", metadata.chunk_index},
       {"total_chunks", metadata.total_chunks},
       {"start_position", metadata.start_position},
       {"end_position", metadata.end_position},
       {"word_count", metadata.word_count},
       {"character_count", metadata.character_count},
       {"sentence_count", metadata.sentence_count},
       {"paragraph_count", metadata.paragraph_count},
       {"headings", metadata.headings},
       {"has_code_blocks", metadata.has_code_blocks},
       {"has_tables", metadata.has_tables},
       {"has_lists", metadata.has_lists}};
  put_optional(j, "summary", metadata.summary);
  put_optional(j, "topics", metadata.topics);
  put_optional(j, "entities", metadata.entities);
  put_optional(j, "previous_chunk_id", metadata.previous_chunk_id);
  put_optional(j, "next_chunk_id", metadata.next_chunk_id);
  put_optional(j, "overlap_with_previous", metadata.overlap_with_previous);
  put_optional(j, "overlap_with_next", metadata.overlap_with_next);
}

void to_json(nlohmann::json& j, const DocumentChunk& chunk) {
  j = {{"id", chunk.id},
       {"document_id", chunk.document_id},
       {"content", chunk.content},
       {"content_hash", chunk.content_hash},
       {"index", chunk.index},
       {"start_char", chunk.start_char},
       {"end_char", chunk.end_char},
       {"metadata", chunk.metadata}};
  put_optional(j, "overlap_start", chunk.overlap_start);
  put_optional(j, "overlap_end", chunk.overlap_end);
}

void to_json(nlohmann::json& j, const ChunkingStats& stats) {
  j = {{"total_chunks", stats.total_chunks},
       {"total_characters", stats.total_characters},
       {"total_words", stats.total_words},
       {"average_chunk_size", stats.average_chunk_size},
       {"min_chunk_size", stats.min_chunk_size},
       {"max_chunk_size", stats.max_chunk_size},
       {"total_overlap", stats.total_overlap},
       {"average_overlap", stats.average_overlap},
       {"heading_count", stats.heading_count},
       {"code_block_count", stats.code_block_count},
       {"table_count", stats.table_count},
       {"list_count", stats.list_count},
       {"undersized_chunks", stats.undersized_chunks}};
}

void to_json(nlohmann::json& j, const StructuralAmbiguityWarning& warning) {
  j = {{"position", warning.position}, {"message", warning.message}};
}

void to_json(nlohmann::json& j, const ChunkingReport& report) {
  j = {{"document_id", report.document_id},
       {"chunks", report.chunks},
       {"statistics", report.statistics},
       {"warnings", report.warnings},
       {"processing_time_ms", report.processing_time.count()}};
}

}  // namespace docsplit_core
