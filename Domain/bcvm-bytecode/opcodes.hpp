#pragma once
#include <cstdint>

namespace bcvm {

  enum Op : uint8_t {
    OP_NOP,
    OP_BREAK,
    OP_LOADNIL,
    OP_LOADB,
    OP_LOADN,
    OP_LOADK,
    OP_MOVE,
    OP_GETGLOBAL,
    OP_SETGLOBAL,
    OP_GETUPVAL,
    OP_SETUPVAL,
    OP_CLOSEUPVALS,
    OP_GETIMPORT,
    OP_GETTABLE,
    OP_SETTABLE,
    OP_GETTABLEKS,
    OP_SETTABLEKS,
    OP_GETTABLEN,
    OP_SETTABLEN,
    OP_NEWCLOSURE,
    OP_NAMECALL,
    OP_CALL,
    OP_RETURN,
    OP_JUMP,
    OP_JUMPBACK,
    OP_JUMPIF,
    OP_JUMPIFNOT,
    OP_JUMPIFEQ,
    OP_JUMPIFLE,
    OP_JUMPIFLT,
    OP_JUMPIFNOTEQ,
    OP_JUMPIFNOTLE,
    OP_JUMPIFNOTLT,
    OP_ADD, OP_SUB, OP_MUL, OP_DIV, OP_MOD, OP_POW,
    OP_ADDK, OP_SUBK, OP_MULK, OP_DIVK, OP_MODK, OP_POWK,
    OP_AND,
    OP_OR,
    OP_ANDK,
    OP_ORK,
    OP_CONCAT,
    OP_NOT,
    OP_MINUS,
    OP_LENGTH,
    OP_NEWTABLE,
    OP_DUPTABLE,
    OP_SETLIST,
    OP_FORNPREP,
    OP_FORNLOOP,
    OP_FORGLOOP,
    OP_FORGPREP_INEXT,
    OP_FASTCALL3,
    OP_FORGPREP_NEXT,
    OP_NATIVECALL,
    OP_GETVARARGS,
    OP_DUPCLOSURE,
    OP_PREPVARARGS,
    OP_LOADKX,
    OP_JUMPX,
    OP_FASTCALL,
    OP_COVERAGE,
    OP_CAPTURE,
    OP_SUBRK,
    OP_DIVRK,
    OP_FASTCALL1,
    OP_FASTCALL2,
    OP_FASTCALL2K,
    OP_FORGPREP,
    OP_JUMPXEQKNIL,
    OP_JUMPXEQKB,
    OP_JUMPXEQKN,
    OP_JUMPXEQKS,
    OP_IDIV,
    OP_IDIVK,
    OP__COUNT
  };

  // which operand fields the instruction word carries
  enum class OpMode : uint8_t { None, A, AB, ABC, AD, AE };

  // which field indexes the constant table, resolved in the second load pass
  enum class KMode : uint8_t {
    None,
    Aux,
    C,
    D,
    AuxImport,
    AuxBoolBit,
    AuxNumberBits,
    B,
    AuxNumberBits16,
  };

  // capture kinds carried by CAPTURE pseudo-instructions (A field)
  enum CaptureType : uint8_t { CAPTURE_VALUE = 0, CAPTURE_REF = 1, CAPTURE_UPVAL = 2 };

  struct OpInfo {
    const char *name;
    OpMode mode;
    KMode kmode;
    bool hasAux;
  };

  const OpInfo &opInfo(uint8_t op);
  const char *opName(uint8_t op);

  inline bool isValidOp(uint32_t op) {
    return op < OP__COUNT;
  }

} // namespace bcvm
