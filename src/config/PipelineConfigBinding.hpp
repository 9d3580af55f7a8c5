#pragma once

#include "PipelineConfig.hpp"

class ConfigManager;

namespace config
{

// Registers the [streaming], [chunking], [assembler] and [translation] tables.
// Loading writes into cfg, clamping out-of-range values (each clamp is
// logged); saving serializes cfg. cfg must outlive the ConfigManager.
bool bindPipelineConfig(ConfigManager& manager, PipelineConfig& cfg);

// Applies the same clamping rules to a config built in code.
void sanitizePipelineConfig(PipelineConfig& cfg);

} // namespace config
