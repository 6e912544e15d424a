#include "docsplit_core/chunking/metadata_generator.hpp"

#include <iostream>
#include <thread>

namespace docsplit_core {

MetadataGenerator::MetadataGenerator(const structure::StructurePatterns& patterns,
                                     EnrichmentClientPtr enrichment,
                                     std::chrono::milliseconds inter_call_delay)
    : patterns_(patterns),
      enrichment_(enrichment ? std::move(enrichment) : std::make_shared<NoopEnrichmentClient>()),
      inter_call_delay_(inter_call_delay) {}

ChunkMetadata MetadataGenerator::generate_basic(const std::string& chunk_content,
                                                const std::string& document_id,
                                                size_t chunk_index,
                                                size_t total_chunks,
                                                size_t start_position,
                                                size_t end_position,
                                                const ChunkNeighbors& neighbors) const {
  ChunkMetadata metadata;
  metadata.document_id = document_id;
  metadata.chunk_index = chunk_index;
  metadata.total_chunks = total_chunks;
  metadata.start_position = start_position;
  metadata.end_position = end_position;

  metadata.word_count = structure::count_words(chunk_content);
  metadata.character_count = chunk_content.size();
  metadata.sentence_count = structure::count_sentences(chunk_content, patterns_);
  metadata.paragraph_count = structure::count_paragraphs(chunk_content);

  metadata.headings = structure::extract_headings(chunk_content, patterns_);
  metadata.has_code_blocks = structure::has_code_blocks(chunk_content, patterns_);
  metadata.has_tables = structure::has_tables(chunk_content, patterns_);
  metadata.has_lists = structure::has_lists(chunk_content, patterns_);

  metadata.previous_chunk_id = neighbors.previous_chunk_id;
  metadata.next_chunk_id = neighbors.next_chunk_id;
  metadata.overlap_with_previous = neighbors.overlap_with_previous;
  metadata.overlap_with_next = neighbors.overlap_with_next;
  return metadata;
}

ChunkMetadata MetadataGenerator::generate(const std::string& chunk_content,
                                          const std::string& document_id,
                                          size_t chunk_index,
                                          size_t total_chunks,
                                          size_t start_position,
                                          size_t end_position,
                                          const ChunkNeighbors& neighbors,
                                          bool enrich) const {
  ChunkMetadata metadata = generate_basic(chunk_content, document_id, chunk_index, total_chunks,
                                          start_position, end_position, neighbors);
  if (enrich) {
    apply_enrichment(chunk_content, metadata);
  }
  return metadata;
}

MetadataGenerator::Outcome MetadataGenerator::try_enrich(const std::string& chunk_content,
                                                         ChunkMetadata& metadata) const {
  try {
    std::optional<Enrichment> enrichment = enrichment_->enrich(chunk_content);
    if (!enrichment) {
      return Outcome::Declined;
    }
    metadata.summary = std::move(enrichment->summary);
    metadata.topics = std::move(enrichment->topics);
    metadata.entities = std::move(enrichment->entities);
    return Outcome::Applied;
  } catch (const EnrichmentError& e) {
    std::cerr << "Warning: enrichment failed for chunk " << metadata.chunk_index << " of "
              << metadata.document_id << ": " << e.what() << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Warning: unexpected enrichment error for chunk " << metadata.chunk_index
              << " of " << metadata.document_id << ": " << e.what() << std::endl;
  }
  return Outcome::Failed;
}

bool MetadataGenerator::apply_enrichment(const std::string& chunk_content,
                                         ChunkMetadata& metadata) const {
  return try_enrich(chunk_content, metadata) == Outcome::Applied;
}

size_t MetadataGenerator::enrich_all(std::vector<DocumentChunk>& chunks) const {
  size_t enriched = 0;
  for (size_t i = 0; i < chunks.size(); ++i) {
    const Outcome outcome = try_enrich(chunks[i].content, chunks[i].metadata);
    if (outcome == Outcome::Applied) {
      ++enriched;
    }
    // A declined call never reached a service; no need to pace
    if (outcome != Outcome::Declined && i + 1 < chunks.size() && inter_call_delay_.count() > 0) {
      std::this_thread::sleep_for(inter_call_delay_);
    }
  }
  return enriched;
}

}  // namespace docsplit_core
