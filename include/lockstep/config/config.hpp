#pragma once

#include "lockstep/config/system_config.hpp"
#include "lockstep/core/error.hpp"

#include <string_view>

namespace lockstep {

// Loads system configuration from TOML, then applies LOCKSTEP_* environment
// overrides and validates the result.
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto validate(const SystemConfig &cfg) -> Result<void>;
};

} // namespace lockstep
