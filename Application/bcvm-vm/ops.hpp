#pragma once
#include "../../Domain/bcvm-core/value.hpp"

namespace bcvm {

  enum class ArithOp { Add, Sub, Mul, Div, Mod, Pow, IDiv };

  const char *arithName(ArithOp op);

  // Numbers and numeric strings; vectors component-wise for add/sub/mul/div.
  Value arith(ArithOp op, const Value &a, const Value &b);
  Value negate(const Value &v);

  bool lessThan(const Value &a, const Value &b);
  bool lessEqual(const Value &a, const Value &b);

  Value length(const Value &v);
  // Concatenates registers [first, last] of `regs`.
  Value concat(const ValueList &regs, uint32_t first, uint32_t last);

} // namespace bcvm
