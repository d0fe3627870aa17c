#pragma once
#include "../bcvm-core/value.hpp"
#include "opcodes.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace bcvm {

  enum class ConstantKind : uint8_t {
    Nil,
    Boolean,
    Number,
    String,
    Import,
    Table,
    Closure,
    Vector,
  };

  struct Constant {
    ConstantKind kind{ConstantKind::Nil};
    Value value;                // Nil, Boolean, Number, String, Vector
    uint32_t import{0};         // Import: packed path id
    std::vector<uint32_t> keys; // Table: template key constant indices
    uint32_t proto{0};          // Closure: prototype index

    bool operator==(const Constant &o) const {
      return kind == o.kind && value == o.value && import == o.import && keys == o.keys && proto == o.proto;
    }
    bool operator!=(const Constant &o) const {
      return !(*this == o);
    }
  };

  // 1-3 segment path into the global environment, decoded from a GETIMPORT aux word
  struct ImportPath {
    uint8_t count{0};
    Value k0, k1, k2;
    bool resolved{false}; // true when `value` holds a load-time resolution
    Value value;
  };

  // One decoded bytecode word. Aux words keep their own slot so that program
  // counters and jump offsets index the word stream directly.
  struct Instruction {
    uint8_t opcode{OP_NOP};
    uint8_t original{OP_NOP}; // opcode to execute after a breakpoint fires
    OpMode mode{OpMode::None};
    KMode kmode{KMode::None};
    bool hasAux{false};
    bool isAuxWord{false};

    uint32_t raw{0};
    uint8_t A{0}, B{0}, C{0};
    int32_t D{0};
    int32_t E{0};
    uint32_t aux{0};

    // resolved by the second load pass according to kmode
    Constant K;
    bool KN{false};
    ImportPath import;

    // COVERAGE execution counter
    uint32_t hits{0};
  };

  struct Prototype {
    uint32_t index{0};
    uint8_t maxStackSize{0};
    uint8_t numParams{0};
    uint8_t numUpvalues{0};
    bool isVararg{false};
    uint8_t flags{0};

    std::vector<Instruction> code;
    std::vector<Constant> constants;
    std::vector<uint32_t> children;

    uint32_t lineDefined{0};
    std::string debugName;

    bool lineInfoEnabled{false};
    std::vector<int> lineInfo; // source line per code slot

    uint32_t sizecode() const {
      return (uint32_t)code.size();
    }
    int lineAt(uint32_t pc) const {
      return lineInfoEnabled && pc < lineInfo.size() ? lineInfo[pc] : 0;
    }
  };

  struct Module {
    uint8_t version{0};
    uint8_t typesVersion{0};
    std::vector<std::string> strings;
    std::vector<Prototype> protos;
    uint32_t mainIndex{0};

    Prototype &main() {
      return protos[mainIndex];
    }
    const Prototype &main() const {
      return protos[mainIndex];
    }

    // Patches the instruction at pc with BREAK (or restores it). The patched
    // instruction still runs once the break hook declines an early return.
    void setBreakpoint(uint32_t protoIndex, uint32_t pc, bool enabled);
    void resetCoverage();
  };

} // namespace bcvm
