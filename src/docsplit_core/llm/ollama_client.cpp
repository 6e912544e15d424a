#include "docsplit_core/llm/ollama_client.hpp"

#include <iostream>
#include <thread>

#include "ollama.hpp"

namespace docsplit_core {

namespace {

std::vector<std::string> string_list(const nlohmann::json &value, size_t limit) {
  std::vector<std::string> out;
  if (!value.is_array()) {
    throw EnrichmentError("Expected an array of strings in enrichment response");
  }
  for (const auto &item : value) {
    if (out.size() >= limit) {
      break;
    }
    if (item.is_string()) {
      out.push_back(item.get<std::string>());
    }
  }
  return out;
}

}  // namespace

OllamaEnrichmentClient::OllamaEnrichmentClient(const std::string &ollama_url,
                                               const std::string &model,
                                               std::chrono::seconds timeout)
    : ollama_url_(ollama_url), model_(model), timeout_(timeout) {
  setup_server_connection();
}

void OllamaEnrichmentClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  ollama::setReadTimeout(static_cast<int>(timeout_.count()));
  ollama::setWriteTimeout(static_cast<int>(timeout_.count()));
  if (!ollama::is_running()) {
    throw OllamaError("Ollama server is not running at " + ollama_url_);
  }
}

std::string OllamaEnrichmentClient::build_prompt(const std::string &text) {
  std::string excerpt = text.substr(0, MAX_PROMPT_TEXT);
  if (text.size() > MAX_PROMPT_TEXT) {
    excerpt += "...[truncated]";
  }

  return "Analyze this text chunk and provide:\n"
         "1. A brief summary (max 100 words)\n"
         "2. Main topics (max 5)\n"
         "3. Key entities mentioned (people, places, organizations, technologies)\n"
         "\n"
         "Text:\n" +
         excerpt +
         "\n\n"
         "Respond in JSON format:\n"
         "{\n"
         "  \"summary\": \"brief summary\",\n"
         "  \"topics\": [\"topic1\", \"topic2\"],\n"
         "  \"entities\": [\"entity1\", \"entity2\"]\n"
         "}";
}

Enrichment OllamaEnrichmentClient::parse_response(const std::string &response_text) {
  nlohmann::json parsed;
  try {
    parsed = nlohmann::json::parse(response_text);
  } catch (const nlohmann::json::parse_error &e) {
    throw EnrichmentError("Enrichment response is not valid JSON: " + std::string(e.what()));
  }

  if (!parsed.is_object()) {
    throw EnrichmentError("Enrichment response is not a JSON object");
  }
  if (!parsed.contains("summary") || !parsed["summary"].is_string()) {
    throw EnrichmentError("Enrichment response does not contain a summary");
  }

  Enrichment enrichment;
  enrichment.summary = parsed["summary"].get<std::string>();
  if (parsed.contains("topics")) {
    enrichment.topics = string_list(parsed["topics"], MAX_TOPICS);
  }
  if (parsed.contains("entities")) {
    enrichment.entities = string_list(parsed["entities"], parsed["entities"].size());
  }
  return enrichment;
}

std::string OllamaEnrichmentClient::generate(const std::string &prompt) {
  ollama::options options;
  options["temperature"] = 0.3;
  options["num_predict"] = 500;

  ollama::request request(model_, prompt, options, false);
  request["format"] = "json";

  std::lock_guard<std::mutex> lock(request_mutex_);
  ollama::response response = ollama::generate(request);
  return response.as_simple_string();
}

std::optional<Enrichment> OllamaEnrichmentClient::enrich(const std::string &text) {
  const std::string prompt = build_prompt(text);

  // One retry with backoff, then give up
  constexpr int max_attempts = 2;
  for (int attempt = 1;; ++attempt) {
    try {
      return parse_response(generate(prompt));
    } catch (const ollama::exception &e) {
      if (attempt >= max_attempts) {
        throw EnrichmentError("Enrichment request failed: " + std::string(e.what()));
      }
      std::cerr << "Warning: enrichment request failed (" << e.what() << "), retrying"
                << std::endl;
      std::this_thread::sleep_for(std::chrono::milliseconds(250 * attempt));
    }
  }
}

}  // namespace docsplit_core
