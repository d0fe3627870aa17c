#pragma once
#include "../../Domain/bcvm-bytecode/module.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bcvm {

  struct ProtoCoverage {
    uint32_t protoIndex{0};
    std::string name;
    uint32_t lineDefined{0};
    uint32_t depth{0};
    std::map<int, uint32_t> hits; // line -> max COVERAGE counter on that line
  };

  // Depth-first over the prototype tree rooted at protoIndex (default: main).
  // Throws std::invalid_argument when a visited prototype has no line info.
  std::vector<ProtoCoverage> collectCoverage(const Module &module, std::optional<uint32_t> protoIndex = std::nullopt);

  int maxCoverageLine(const Module &module, std::optional<uint32_t> protoIndex = std::nullopt);

} // namespace bcvm
