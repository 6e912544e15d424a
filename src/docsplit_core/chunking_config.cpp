#include "docsplit_core/chunking_config.hpp"

namespace docsplit_core {

namespace {

std::optional<size_t> read_size(const nlohmann::json& json_config, const char* key) {
  if (!json_config.contains(key)) {
    return std::nullopt;
  }
  const auto& value = json_config.at(key);
  if (!value.is_number_integer()) {
    throw ConfigurationError(std::string(key) + " must be an integer");
  }
  const long long raw = value.get<long long>();
  if (raw < 0) {
    throw ConfigurationError(std::string(key) + " cannot be negative");
  }
  return static_cast<size_t>(raw);
}

std::optional<bool> read_bool(const nlohmann::json& json_config, const char* key) {
  if (!json_config.contains(key)) {
    return std::nullopt;
  }
  const auto& value = json_config.at(key);
  if (!value.is_boolean()) {
    throw ConfigurationError(std::string(key) + " must be a boolean");
  }
  return value.get<bool>();
}

}  // namespace

ChunkingConfig::ChunkingConfig(size_t max_chunk_size,
                               size_t min_chunk_size,
                               int overlap_percentage,
                               bool use_smart_boundaries,
                               bool preserve_structure,
                               size_t metadata_overhead)
    : max_chunk_size_(max_chunk_size),
      min_chunk_size_(min_chunk_size),
      overlap_percentage_(overlap_percentage),
      use_smart_boundaries_(use_smart_boundaries),
      preserve_structure_(preserve_structure),
      metadata_overhead_(metadata_overhead) {
  if (max_chunk_size_ == 0) {
    throw ConfigurationError("max_chunk_size must be positive");
  }
  if (metadata_overhead_ >= max_chunk_size_) {
    throw ConfigurationError("metadata_overhead (" + std::to_string(metadata_overhead_) +
                             ") must be smaller than max_chunk_size (" +
                             std::to_string(max_chunk_size_) + ")");
  }
  if (overlap_percentage_ < 0 || overlap_percentage_ > 100) {
    throw ConfigurationError("overlap_percentage must be between 0 and 100, got " +
                             std::to_string(overlap_percentage_));
  }
}

ChunkingConfig ChunkingConfig::defaults() {
  return ChunkingConfig(DEFAULT_MAX_CHUNK_SIZE, DEFAULT_MIN_CHUNK_SIZE, DEFAULT_OVERLAP_PERCENTAGE,
                        true, true, DEFAULT_METADATA_OVERHEAD);
}

ChunkingConfig ChunkingConfig::from_overrides(const ChunkingConfigOverrides& overrides) {
  return ChunkingConfig(overrides.max_chunk_size.value_or(DEFAULT_MAX_CHUNK_SIZE),
                        overrides.min_chunk_size.value_or(DEFAULT_MIN_CHUNK_SIZE),
                        overrides.overlap_percentage.value_or(DEFAULT_OVERLAP_PERCENTAGE),
                        overrides.use_smart_boundaries.value_or(true),
                        overrides.preserve_structure.value_or(true),
                        overrides.metadata_overhead.value_or(DEFAULT_METADATA_OVERHEAD));
}

ChunkingConfig ChunkingConfig::from_json(const nlohmann::json& json_config) {
  if (!json_config.is_object()) {
    throw ConfigurationError("chunking configuration must be a JSON object");
  }

  ChunkingConfigOverrides overrides;
  overrides.max_chunk_size = read_size(json_config, "max_chunk_size");
  overrides.min_chunk_size = read_size(json_config, "min_chunk_size");
  overrides.metadata_overhead = read_size(json_config, "metadata_overhead");
  overrides.use_smart_boundaries = read_bool(json_config, "use_smart_boundaries");
  overrides.preserve_structure = read_bool(json_config, "preserve_structure");

  if (json_config.contains("overlap_percentage")) {
    const auto& value = json_config.at("overlap_percentage");
    if (!value.is_number_integer()) {
      throw ConfigurationError("overlap_percentage must be an integer");
    }
    const long long raw = value.get<long long>();
    if (raw < 0 || raw > 100) {
      throw ConfigurationError("overlap_percentage must be between 0 and 100, got " +
                               std::to_string(raw));
    }
    overrides.overlap_percentage = static_cast<int>(raw);
  }

  return from_overrides(overrides);
}

nlohmann::json ChunkingConfig::to_json() const {
  return {{"max_chunk_size", max_chunk_size_},
          {"min_chunk_size", min_chunk_size_},
          {"overlap_percentage", overlap_percentage_},
          {"use_smart_boundaries", use_smart_boundaries_},
          {"preserve_structure", preserve_structure_},
          {"metadata_overhead", metadata_overhead_}};
}

}  // namespace docsplit_core
