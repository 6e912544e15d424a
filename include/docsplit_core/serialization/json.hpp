#pragma once

#include <nlohmann/json.hpp>

#include "docsplit_core/types.hpp"

// nlohmann::json conversions, found through ADL. Unset optional fields are
// left out of the output.
namespace docsplit_core {

void to_json(nlohmann::json& j, const ChunkBoundary& boundary);
void to_json(nlohmann::json& j, const Heading& heading);
void to_json(nlohmann::json& j, const ChunkMetadata& metadata);
void to_json(nlohmann::json& j, const DocumentChunk& chunk);
void to_json(nlohmann::json& j, const ChunkingStats& stats);
void to_json(nlohmann::json& j, const StructuralAmbiguityWarning& warning);
void to_json(nlohmann::json& j, const ChunkingReport& report);

}  // namespace docsplit_core
