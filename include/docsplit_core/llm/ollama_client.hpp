#pragma once

#include <chrono>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "docsplit_core/llm/enrichment_client.hpp"

namespace docsplit_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class OllamaEnrichmentClient
 * @brief Summaries, topics and entities from a local Ollama server.
 *
 * Requests are serialized; ollama-hpp talks to a single server connection.
 */
class OllamaEnrichmentClient : public EnrichmentClient {
 public:
  static constexpr size_t MAX_PROMPT_TEXT = 2000;
  static constexpr int MAX_TOPICS = 5;

  /**
   * @throw OllamaError if the server does not answer at ollama_url.
   */
  OllamaEnrichmentClient(const std::string &ollama_url,
                         const std::string &model,
                         std::chrono::seconds timeout = std::chrono::seconds(30));
  ~OllamaEnrichmentClient() override = default;

  // Disable copy constructor and assignment
  OllamaEnrichmentClient(const OllamaEnrichmentClient &) = delete;
  OllamaEnrichmentClient &operator=(const OllamaEnrichmentClient &) = delete;

  std::optional<Enrichment> enrich(const std::string &text) override;

  // Exposed for tests; neither touches the network.
  static std::string build_prompt(const std::string &text);
  static Enrichment parse_response(const std::string &response_text);

 private:
  std::string ollama_url_;
  std::string model_;
  std::chrono::seconds timeout_;
  std::mutex request_mutex_;

  void setup_server_connection();
  std::string generate(const std::string &prompt);
};

}  // namespace docsplit_core
