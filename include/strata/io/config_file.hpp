#pragma once

#include "strata/engine_config.hpp"

#include <filesystem>
#include <string_view>

namespace strata::io {

// Overlays a YAML document on the default EngineConfig:
//
//   verbose: false
//   scan:      {dimension: "minecraft:overworld", probe_top: 319, probe_bottom: -64}
//   obstacles: {max_step: 1}
//   path:      {elevation_penalty: 1.0, clearance: 1, margin: 16}
//   flatten:   {fill: dirt, surface: "grass_block[snowy=false]"}
//   place:     {flush_interval: 4096}
//
// Keys may be omitted; unknown keys are ignored. A value of the wrong type
// throws std::invalid_argument naming the key.
EngineConfig engine_config_from_yaml(std::string_view text);

// As above, from a file. Throws core::LoadError if it cannot be read.
EngineConfig load_engine_config(const std::filesystem::path& file);

} // namespace strata::io
