#include "module.hpp"
#include <fmt/core.h>
#include <stdexcept>

namespace bcvm {

  void Module::setBreakpoint(uint32_t protoIndex, uint32_t pc, bool enabled) {
    if (protoIndex >= protos.size())
      throw std::out_of_range(fmt::format("prototype {} out of range", protoIndex));
    auto &code = protos[protoIndex].code;
    if (pc >= code.size() || code[pc].isAuxWord)
      throw std::out_of_range(fmt::format("pc {} is not an instruction of prototype {}", pc, protoIndex));
    auto &inst  = code[pc];
    inst.opcode = enabled ? (uint8_t)OP_BREAK : inst.original;
  }

  void Module::resetCoverage() {
    for (auto &p : protos)
      for (auto &inst : p.code)
        inst.hits = 0;
  }

} // namespace bcvm
