#include "coverage.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <stdexcept>

namespace bcvm {

  static const Prototype &root_of(const Module &module, std::optional<uint32_t> protoIndex) {
    uint32_t index = protoIndex.value_or(module.mainIndex);
    if (index >= module.protos.size())
      throw std::invalid_argument(fmt::format("prototype {} out of range", index));
    return module.protos[index];
  }

  static void require_lines(const Prototype &p) {
    if (!p.lineInfoEnabled)
      throw std::invalid_argument(fmt::format("prototype {} ({}) has no line info", p.index, p.debugName));
  }

  static void walk(const Module &module, const Prototype &p, uint32_t depth, std::vector<ProtoCoverage> &out) {
    require_lines(p);
    ProtoCoverage c;
    c.protoIndex  = p.index;
    c.name        = p.debugName;
    c.lineDefined = p.lineDefined;
    c.depth       = depth;
    for (uint32_t pc = 0; pc < p.code.size(); ++pc) {
      const Instruction &inst = p.code[pc];
      if (inst.isAuxWord || inst.original != OP_COVERAGE)
        continue;
      uint32_t &slot = c.hits[p.lineAt(pc)];
      slot           = std::max(slot, inst.hits);
    }
    out.push_back(std::move(c));
    for (uint32_t child : p.children)
      walk(module, module.protos[child], depth + 1, out);
  }

  std::vector<ProtoCoverage> collectCoverage(const Module &module, std::optional<uint32_t> protoIndex) {
    std::vector<ProtoCoverage> out;
    walk(module, root_of(module, protoIndex), 0, out);
    return out;
  }

  static int max_line(const Module &module, const Prototype &p) {
    require_lines(p);
    int best = 0;
    for (int line : p.lineInfo)
      best = std::max(best, line);
    for (uint32_t child : p.children)
      best = std::max(best, max_line(module, module.protos[child]));
    return best;
  }

  int maxCoverageLine(const Module &module, std::optional<uint32_t> protoIndex) {
    return max_line(module, root_of(module, protoIndex));
  }

} // namespace bcvm
