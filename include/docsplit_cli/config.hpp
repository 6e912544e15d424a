#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "docsplit_core/chunking_config.hpp"

namespace docsplit_cli {

class AppConfig {
 public:
  std::string ollama_url;
  std::string enrichment_model;
  bool enrichment_enabled;
  int enrichment_timeout_seconds;
  int enrichment_delay_ms;
  int num_workers;
  docsplit_core::ChunkingConfig chunking = docsplit_core::ChunkingConfig::defaults();

  // Load configuration from a JSON file at the given path
  static AppConfig from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static AppConfig from_json(const nlohmann::json& json_config) {
    AppConfig config;

    // Apply defaults when keys are missing
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.enrichment_model = json_config.value("enrichment_model", std::string("llama3.2"));
    config.enrichment_enabled = json_config.value("enrichment_enabled", false);
    config.enrichment_timeout_seconds = json_config.value("enrichment_timeout_seconds", 30);
    config.enrichment_delay_ms = json_config.value("enrichment_delay_ms", 100);
    config.num_workers = json_config.value("num_workers", 1);

    if (json_config.contains("chunking")) {
      config.chunking = docsplit_core::ChunkingConfig::from_json(json_config.at("chunking"));
    }

    config.validate();
    return config;
  }

 private:
  void validate() const {
    if (enrichment_enabled && ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty when enrichment_enabled is true");
    }
    if (enrichment_enabled && enrichment_model.empty()) {
      throw std::runtime_error("enrichment_model cannot be empty when enrichment_enabled is true");
    }
    if (enrichment_timeout_seconds < 1) {
      throw std::runtime_error("enrichment_timeout_seconds must be at least 1 second");
    }
    if (enrichment_delay_ms < 0) {
      throw std::runtime_error("enrichment_delay_ms cannot be negative");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
  }
};

}  // namespace docsplit_cli
