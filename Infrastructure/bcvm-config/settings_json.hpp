#pragma once
#include "../../Application/bcvm-vm/settings.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace bcvm {

  // Scalar load options only; callbacks and tables stay host-provided.
  // Keys missing from the document keep the value already in `base`.
  // Throws std::invalid_argument for unknown keys and mistyped values.
  Settings settingsFromJson(const nlohmann::json &j, Settings base = Settings{});
  Settings settingsFromFile(const std::string &path, Settings base = Settings{});

  nlohmann::json settingsToJson(const Settings &s);

} // namespace bcvm
