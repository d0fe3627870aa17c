#pragma once
#include "../../Domain/bcvm-bytecode/module.hpp"
#include "iteration.hpp"
#include "upvalue.hpp"
#include <memory>
#include <utility>
#include <vector>

namespace bcvm {

  // Activation record of one closure invocation. Declaration order matters:
  // the upvalue registry closes over `registers` when the frame is destroyed.
  struct CallFrame {
    CallFrame(Prototype &p, const ValueList &args);

    CallFrame(const CallFrame &)            = delete;
    CallFrame &operator=(const CallFrame &) = delete;

    // grows the register file so that slot n - 1 exists
    void ensure(std::size_t n, uint32_t maxRegisters);

    IterationBridge *findIterator(uint32_t loopPc);
    IterationBridge &addIterator(uint32_t loopPc, IterationBridge bridge);
    void dropIterator(uint32_t loopPc);

    Prototype &proto;
    ValueList registers;
    ValueList varargs;
    uint32_t pc{0};      // next slot to fetch
    uint32_t current{0}; // slot being executed
    int top{-1};         // last register written by an open-arity op
    UpvalueRegistry upvalues{registers};
    // generalized-iteration bridges keyed by their FORGLOOP slot
    std::vector<std::pair<uint32_t, std::unique_ptr<IterationBridge>>> iterators;
  };

} // namespace bcvm
