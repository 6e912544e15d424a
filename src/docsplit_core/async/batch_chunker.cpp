#include "docsplit_core/async/batch_chunker.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "docsplit_core/chunking/chunking_engine.hpp"

namespace docsplit_core::async {

BatchChunker::BatchChunker(size_t num_workers, const ChunkingEngine& engine)
    : num_workers_(num_workers), engine_(engine) {
  if (num_workers_ == 0) {
    throw std::invalid_argument("BatchChunker must have at least one worker.");
  }
}

std::vector<BatchResult> BatchChunker::run(const std::vector<SourceDocument>& documents) const {
  std::vector<BatchResult> results(documents.size());
  std::atomic<size_t> next_index{0};

  auto worker_loop = [&](size_t worker_id) {
    while (true) {
      const size_t index = next_index.fetch_add(1);
      if (index >= documents.size()) {
        break;
      }
      const SourceDocument& document = documents[index];
      BatchResult& result = results[index];
      result.document_id = document.id;
      try {
        result.report = engine_.chunk_document_with_report(document.id, document.content);
      } catch (const std::exception& e) {
        std::cerr << "Worker [" << worker_id << "] ERROR chunking document " << document.id
                  << ": " << e.what() << std::endl;
        result.error = e.what();
      }
    }
  };

  const size_t thread_count = std::min(num_workers_, documents.size());
  if (thread_count <= 1) {
    worker_loop(0);
    return results;
  }

  std::vector<std::thread> workers;
  workers.reserve(thread_count);
  for (size_t i = 0; i < thread_count; ++i) {
    workers.emplace_back(worker_loop, i);
  }
  for (auto& worker : workers) {
    worker.join();
  }
  return results;
}

}  // namespace docsplit_core::async
