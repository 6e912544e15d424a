#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace docsplit_core {

class ConfigurationError : public std::exception {
 public:
  explicit ConfigurationError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Sparse caller-supplied settings. Unset fields fall back to the defaults.
struct ChunkingConfigOverrides {
  std::optional<size_t> max_chunk_size;
  std::optional<size_t> min_chunk_size;
  std::optional<int> overlap_percentage;
  std::optional<bool> use_smart_boundaries;
  std::optional<bool> preserve_structure;
  std::optional<size_t> metadata_overhead;
};

/**
 * @class ChunkingConfig
 * @brief Immutable, validated settings for one chunking run.
 *
 * Instances can only be created through the validating constructor or the
 * factory functions, so every ChunkingConfig in the program satisfies
 * effective_budget() > 0 and 0 <= overlap_percentage() <= 100.
 */
class ChunkingConfig {
 public:
  static constexpr size_t DEFAULT_MAX_CHUNK_SIZE = 10000;
  static constexpr size_t DEFAULT_MIN_CHUNK_SIZE = 500;
  static constexpr int DEFAULT_OVERLAP_PERCENTAGE = 15;
  static constexpr size_t DEFAULT_METADATA_OVERHEAD = 500;

  /**
   * @throw ConfigurationError if metadata_overhead >= max_chunk_size or
   *        overlap_percentage is outside 0..100.
   */
  ChunkingConfig(size_t max_chunk_size,
                 size_t min_chunk_size,
                 int overlap_percentage,
                 bool use_smart_boundaries,
                 bool preserve_structure,
                 size_t metadata_overhead);

  static ChunkingConfig defaults();

  // Merges the overrides over the defaults once, then validates.
  static ChunkingConfig from_overrides(const ChunkingConfigOverrides& overrides);

  // Reads the snake_case keys of a JSON object; missing keys take defaults.
  static ChunkingConfig from_json(const nlohmann::json& json_config);

  size_t max_chunk_size() const {
    return max_chunk_size_;
  }
  size_t min_chunk_size() const {
    return min_chunk_size_;
  }
  int overlap_percentage() const {
    return overlap_percentage_;
  }
  bool use_smart_boundaries() const {
    return use_smart_boundaries_;
  }
  bool preserve_structure() const {
    return preserve_structure_;
  }
  size_t metadata_overhead() const {
    return metadata_overhead_;
  }

  // Real content ceiling per chunk.
  size_t effective_budget() const {
    return max_chunk_size_ - metadata_overhead_;
  }

  nlohmann::json to_json() const;

 private:
  size_t max_chunk_size_;
  size_t min_chunk_size_;
  int overlap_percentage_;
  bool use_smart_boundaries_;
  bool preserve_structure_;
  size_t metadata_overhead_;
};

}  // namespace docsplit_core
