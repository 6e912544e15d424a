#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docsplit_core {

class EnrichmentError : public std::exception {
 public:
  explicit EnrichmentError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct Enrichment {
  std::string summary;
  std::vector<std::string> topics;
  std::vector<std::string> entities;
};

/**
 * @class EnrichmentClient
 * @brief Optional semantic annotation of chunk text.
 *
 * enrich() returns std::nullopt when the capability has nothing to offer and
 * throws EnrichmentError when a call fails. Implementations used with the
 * BatchChunker must tolerate calls from several threads.
 */
class EnrichmentClient {
 public:
  virtual ~EnrichmentClient() = default;

  virtual std::optional<Enrichment> enrich(const std::string &text) = 0;
};

// The absent capability.
class NoopEnrichmentClient : public EnrichmentClient {
 public:
  std::optional<Enrichment> enrich(const std::string &) override {
    return std::nullopt;
  }
};

using EnrichmentClientPtr = std::shared_ptr<EnrichmentClient>;

}  // namespace docsplit_core
