#pragma once

#include <optional>
#include <string>
#include <vector>

#include "docsplit_core/types.hpp"

namespace docsplit_core {
class ChunkingEngine;
}

namespace docsplit_core::async {

struct SourceDocument {
  std::string id;
  std::string content;
};

struct BatchResult {
  std::string document_id;
  std::optional<ChunkingReport> report;
  std::optional<std::string> error;

  bool success() const {
    return report.has_value();
  }
};

/**
 * @class BatchChunker
 * @brief Chunks independent documents on a bounded set of worker threads.
 *
 * Documents share nothing, so each worker simply claims the next unprocessed
 * index. A failure is recorded on that document's result and never affects
 * the others. Results come back in input order.
 */
class BatchChunker {
 public:
  /**
   * @param num_workers Maximum number of documents chunked at once.
   * @param engine Shared engine; must outlive the chunker.
   * @throw std::invalid_argument if num_workers is 0.
   */
  BatchChunker(size_t num_workers, const ChunkingEngine& engine);

  std::vector<BatchResult> run(const std::vector<SourceDocument>& documents) const;

  size_t num_workers() const {
    return num_workers_;
  }

  BatchChunker(const BatchChunker&) = delete;
  BatchChunker& operator=(const BatchChunker&) = delete;
  BatchChunker(BatchChunker&&) = delete;
  BatchChunker& operator=(BatchChunker&&) = delete;

 private:
  size_t num_workers_;
  const ChunkingEngine& engine_;
};

}  // namespace docsplit_core::async
