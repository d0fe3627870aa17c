#include "ops.hpp"
#include "../../Domain/bcvm-core/errors.hpp"
#include "../../Domain/bcvm-core/table.hpp"
#include <cmath>
#include <fmt/core.h>

namespace bcvm {

  const char *arithName(ArithOp op) {
    switch (op) {
    case ArithOp::Add:
      return "add";
    case ArithOp::Sub:
      return "sub";
    case ArithOp::Mul:
      return "mul";
    case ArithOp::Div:
      return "div";
    case ArithOp::Mod:
      return "mod";
    case ArithOp::Pow:
      return "pow";
    case ArithOp::IDiv:
      return "idiv";
    }
    return "?";
  }

  static double arith_num(ArithOp op, double a, double b) {
    switch (op) {
    case ArithOp::Add:
      return a + b;
    case ArithOp::Sub:
      return a - b;
    case ArithOp::Mul:
      return a * b;
    case ArithOp::Div:
      return a / b;
    case ArithOp::Mod:
      return a - std::floor(a / b) * b;
    case ArithOp::Pow:
      return std::pow(a, b);
    case ArithOp::IDiv:
      return std::floor(a / b);
    }
    return 0;
  }

  static Vector arith_vec(ArithOp op, const Vector &a, const Vector &b) {
    return Vector{(float)arith_num(op, a.x, b.x), (float)arith_num(op, a.y, b.y), (float)arith_num(op, a.z, b.z),
                  (float)arith_num(op, a.w, b.w)};
  }

  static Vector splat(double n) {
    return Vector{(float)n, (float)n, (float)n, (float)n};
  }

  [[noreturn]] static void arith_error(ArithOp op, const Value &a, const Value &b) {
    throw RuntimeFault(fmt::format("attempt to perform arithmetic ({}) on {} and {}", arithName(op), typeName(a.type()),
                                   typeName(b.type())));
  }

  Value arith(ArithOp op, const Value &a, const Value &b) {
    if (a.isNumber() && b.isNumber())
      return arith_num(op, a.asNumber(), b.asNumber());

    bool vecOp = op == ArithOp::Add || op == ArithOp::Sub || op == ArithOp::Mul || op == ArithOp::Div;
    if (vecOp && a.isVector() && b.isVector())
      return arith_vec(op, a.asVector(), b.asVector());
    // scaling only; adding a scalar to a vector is an error
    if ((op == ArithOp::Mul || op == ArithOp::Div) && a.isVector() && b.isNumber())
      return arith_vec(op, a.asVector(), splat(b.asNumber()));
    if ((op == ArithOp::Mul || op == ArithOp::Div) && a.isNumber() && b.isVector())
      return arith_vec(op, splat(a.asNumber()), b.asVector());

    auto na = toNumber(a);
    auto nb = toNumber(b);
    if (!na || !nb)
      arith_error(op, a, b);
    return arith_num(op, *na, *nb);
  }

  Value negate(const Value &v) {
    if (v.isNumber())
      return -v.asNumber();
    if (v.isVector()) {
      auto &a = v.asVector();
      return Vector{-a.x, -a.y, -a.z, -a.w};
    }
    if (auto n = toNumber(v))
      return -*n;
    throw RuntimeFault(fmt::format("attempt to perform arithmetic (unm) on {}", typeName(v.type())));
  }

  [[noreturn]] static void compare_error(const Value &a, const Value &b) {
    if (a.type() == b.type())
      throw RuntimeFault(fmt::format("attempt to compare two {} values", typeName(a.type())));
    throw RuntimeFault(fmt::format("attempt to compare {} with {}", typeName(a.type()), typeName(b.type())));
  }

  bool lessThan(const Value &a, const Value &b) {
    if (a.isNumber() && b.isNumber())
      return a.asNumber() < b.asNumber();
    if (a.isString() && b.isString())
      return a.asString() < b.asString();
    compare_error(a, b);
  }

  bool lessEqual(const Value &a, const Value &b) {
    if (a.isNumber() && b.isNumber())
      return a.asNumber() <= b.asNumber();
    if (a.isString() && b.isString())
      return a.asString() <= b.asString();
    compare_error(a, b);
  }

  Value length(const Value &v) {
    if (v.isString())
      return (double)v.asString().size();
    if (v.isTable())
      return (double)v.asTable()->length();
    throw RuntimeFault(fmt::format("attempt to get length of a {} value", typeName(v.type())));
  }

  Value concat(const ValueList &regs, uint32_t first, uint32_t last) {
    std::string out;
    for (uint32_t i = first; i <= last; ++i) {
      const Value &v = regs[i];
      if (v.isString())
        out += v.asString();
      else if (v.isNumber())
        out += formatNumber(v.asNumber());
      else
        throw RuntimeFault(fmt::format("attempt to concatenate a {} value", typeName(v.type())));
    }
    return out;
  }

} // namespace bcvm
