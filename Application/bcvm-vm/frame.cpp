#include "frame.hpp"
#include "../../Domain/bcvm-core/errors.hpp"
#include <algorithm>

namespace bcvm {

  CallFrame::CallFrame(Prototype &p, const ValueList &args) : proto(p) {
    registers.resize(std::max<std::size_t>(p.maxStackSize, 1));
    std::size_t fixed = std::min<std::size_t>(p.numParams, args.size());
    std::copy(args.begin(), args.begin() + fixed, registers.begin());
    if (p.isVararg && args.size() > p.numParams)
      varargs.assign(args.begin() + p.numParams, args.end());
  }

  void CallFrame::ensure(std::size_t n, uint32_t maxRegisters) {
    if (n <= registers.size())
      return;
    if (n > maxRegisters)
      throw RuntimeFault("stack overflow");
    registers.resize(n);
  }

  IterationBridge *CallFrame::findIterator(uint32_t loopPc) {
    for (auto &entry : iterators)
      if (entry.first == loopPc)
        return entry.second.get();
    return nullptr;
  }

  IterationBridge &CallFrame::addIterator(uint32_t loopPc, IterationBridge bridge) {
    dropIterator(loopPc);
    iterators.emplace_back(loopPc, std::make_unique<IterationBridge>(std::move(bridge)));
    return *iterators.back().second;
  }

  void CallFrame::dropIterator(uint32_t loopPc) {
    iterators.erase(std::remove_if(iterators.begin(), iterators.end(), [&](const auto &e) { return e.first == loopPc; }),
                    iterators.end());
  }

} // namespace bcvm
