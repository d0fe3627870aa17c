#pragma once
#include "../../Domain/bcvm-bytecode/module.hpp"
#include <nlohmann/json.hpp>

namespace bcvm {

  // Prototypes, constants and decoded instructions of a loaded module.
  nlohmann::json dumpModuleJson(const Module &module);

} // namespace bcvm
