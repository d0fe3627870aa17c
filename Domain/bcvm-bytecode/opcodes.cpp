#include "opcodes.hpp"

namespace bcvm {

  using M = OpMode;
  using K = KMode;

  static const OpInfo kOps[OP__COUNT] = {
      {"NOP", M::None, K::None, false},
      {"BREAK", M::None, K::None, false},
      {"LOADNIL", M::A, K::None, false},
      {"LOADB", M::ABC, K::None, false},
      {"LOADN", M::AD, K::None, false},
      {"LOADK", M::AD, K::D, false},
      {"MOVE", M::AB, K::None, false},
      {"GETGLOBAL", M::A, K::Aux, true},
      {"SETGLOBAL", M::A, K::Aux, true},
      {"GETUPVAL", M::AB, K::None, false},
      {"SETUPVAL", M::AB, K::None, false},
      {"CLOSEUPVALS", M::A, K::None, false},
      {"GETIMPORT", M::AD, K::AuxImport, true},
      {"GETTABLE", M::ABC, K::None, false},
      {"SETTABLE", M::ABC, K::None, false},
      {"GETTABLEKS", M::ABC, K::Aux, true},
      {"SETTABLEKS", M::ABC, K::Aux, true},
      {"GETTABLEN", M::ABC, K::None, false},
      {"SETTABLEN", M::ABC, K::None, false},
      {"NEWCLOSURE", M::AD, K::None, false},
      {"NAMECALL", M::ABC, K::Aux, true},
      {"CALL", M::ABC, K::None, false},
      {"RETURN", M::AB, K::None, false},
      {"JUMP", M::AD, K::None, false},
      {"JUMPBACK", M::AD, K::None, false},
      {"JUMPIF", M::AD, K::None, false},
      {"JUMPIFNOT", M::AD, K::None, false},
      {"JUMPIFEQ", M::AD, K::None, true},
      {"JUMPIFLE", M::AD, K::None, true},
      {"JUMPIFLT", M::AD, K::None, true},
      {"JUMPIFNOTEQ", M::AD, K::None, true},
      {"JUMPIFNOTLE", M::AD, K::None, true},
      {"JUMPIFNOTLT", M::AD, K::None, true},
      {"ADD", M::ABC, K::None, false},
      {"SUB", M::ABC, K::None, false},
      {"MUL", M::ABC, K::None, false},
      {"DIV", M::ABC, K::None, false},
      {"MOD", M::ABC, K::None, false},
      {"POW", M::ABC, K::None, false},
      {"ADDK", M::ABC, K::C, false},
      {"SUBK", M::ABC, K::C, false},
      {"MULK", M::ABC, K::C, false},
      {"DIVK", M::ABC, K::C, false},
      {"MODK", M::ABC, K::C, false},
      {"POWK", M::ABC, K::C, false},
      {"AND", M::ABC, K::None, false},
      {"OR", M::ABC, K::None, false},
      {"ANDK", M::ABC, K::C, false},
      {"ORK", M::ABC, K::C, false},
      {"CONCAT", M::ABC, K::None, false},
      {"NOT", M::AB, K::None, false},
      {"MINUS", M::AB, K::None, false},
      {"LENGTH", M::AB, K::None, false},
      {"NEWTABLE", M::AB, K::None, true},
      {"DUPTABLE", M::AD, K::D, false},
      {"SETLIST", M::ABC, K::None, true},
      {"FORNPREP", M::AD, K::None, false},
      {"FORNLOOP", M::AD, K::None, false},
      {"FORGLOOP", M::AD, K::AuxNumberBits16, true},
      {"FORGPREP_INEXT", M::AD, K::None, false},
      {"FASTCALL3", M::ABC, K::Aux, true},
      {"FORGPREP_NEXT", M::AD, K::None, false},
      {"NATIVECALL", M::None, K::None, false},
      {"GETVARARGS", M::AB, K::None, false},
      {"DUPCLOSURE", M::AD, K::D, false},
      {"PREPVARARGS", M::A, K::None, false},
      {"LOADKX", M::A, K::Aux, true},
      {"JUMPX", M::AE, K::None, false},
      {"FASTCALL", M::ABC, K::None, false},
      {"COVERAGE", M::AE, K::None, false},
      {"CAPTURE", M::AB, K::None, false},
      {"SUBRK", M::ABC, K::B, false},
      {"DIVRK", M::ABC, K::B, false},
      {"FASTCALL1", M::ABC, K::None, false},
      {"FASTCALL2", M::ABC, K::None, true},
      {"FASTCALL2K", M::ABC, K::Aux, true},
      {"FORGPREP", M::AD, K::None, false},
      {"JUMPXEQKNIL", M::AD, K::AuxBoolBit, true},
      {"JUMPXEQKB", M::AD, K::AuxBoolBit, true},
      {"JUMPXEQKN", M::AD, K::AuxNumberBits, true},
      {"JUMPXEQKS", M::AD, K::AuxNumberBits, true},
      {"IDIV", M::ABC, K::None, false},
      {"IDIVK", M::ABC, K::C, false},
  };

  const OpInfo &opInfo(uint8_t op) {
    static const OpInfo invalid{"INVALID", M::None, K::None, false};
    return op < OP__COUNT ? kOps[op] : invalid;
  }

  const char *opName(uint8_t op) {
    return opInfo(op).name;
  }

} // namespace bcvm
