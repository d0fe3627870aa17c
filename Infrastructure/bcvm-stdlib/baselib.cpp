#include "baselib.hpp"
#include "../../Application/bcvm-vm/vm.hpp"
#include "../../Domain/bcvm-core/errors.hpp"
#include "../../Domain/bcvm-core/function.hpp"
#include <cctype>
#include <cmath>
#include <fmt/core.h>

namespace bcvm {

  static const TableRef &check_table(const ValueList &args, std::size_t i, const char *fn) {
    const Value &v = arg(args, i);
    if (!v.isTable())
      throw RuntimeFault(fmt::format("invalid argument #{} to '{}' (table expected, got {})", i + 1, fn,
                                     typeName(v.type())));
    return v.asTable();
  }

  static double check_number(const ValueList &args, std::size_t i, const char *fn) {
    if (auto n = toNumber(arg(args, i)))
      return *n;
    throw RuntimeFault(fmt::format("invalid argument #{} to '{}' (number expected, got {})", i + 1, fn,
                                   typeName(arg(args, i).type())));
  }

  // integer in base 2..36, surrounding whitespace allowed
  static std::optional<double> parse_in_base(const std::string &s, int base) {
    std::size_t i = 0, n = s.size();
    while (i < n && std::isspace((unsigned char)s[i]))
      ++i;
    bool neg = false;
    if (i < n && (s[i] == '-' || s[i] == '+'))
      neg = s[i++] == '-';
    double acc  = 0;
    bool digits = false;
    for (; i < n && std::isalnum((unsigned char)s[i]); ++i) {
      int c = std::tolower((unsigned char)s[i]);
      int d = std::isdigit(c) ? c - '0' : c - 'a' + 10;
      if (d >= base)
        return std::nullopt;
      acc    = acc * base + d;
      digits = true;
    }
    while (i < n && std::isspace((unsigned char)s[i]))
      ++i;
    if (!digits || i != n)
      return std::nullopt;
    return neg ? -acc : acc;
  }

  static ValueList base_next(const ValueList &args) {
    const TableRef &t = check_table(args, 0, "next");
    auto entry        = t->next(arg(args, 1));
    if (!entry)
      return {Value()};
    return {entry->first, entry->second};
  }

  static ValueList base_ipairs_step(const ValueList &args) {
    const TableRef &t = check_table(args, 0, "ipairs");
    double i          = check_number(args, 1, "ipairs") + 1;
    Value v           = t->getInt((long long)i);
    if (v.isNil())
      return {Value()};
    return {i, v};
  }

  void openBaseLibrary(const TableRef &env) {
    auto next        = makeNative("next", base_next);
    auto ipairs_step = makeNative("ipairs_step", base_ipairs_step);

    env->setField("print", makeNative("print", [](const ValueList &args) {
                    std::string line;
                    for (std::size_t i = 0; i < args.size(); ++i) {
                      if (i)
                        line += '\t';
                      line += toString(args[i]);
                    }
                    fmt::print("{}\n", line);
                    return ValueList{};
                  }));

    env->setField("type", makeNative("type", [](const ValueList &args) {
                    if (args.empty())
                      throw RuntimeFault("missing argument #1 to 'type'");
                    return ValueList{typeName(args[0].type())};
                  }));

    env->setField("tostring", makeNative("tostring", [](const ValueList &args) {
                    return ValueList{toString(arg(args, 0))};
                  }));

    env->setField("tonumber", makeNative("tonumber", [](const ValueList &args) {
                    const Value &v = arg(args, 0);
                    if (arg(args, 1).isNil()) {
                      auto n = toNumber(v);
                      return ValueList{n ? Value(*n) : Value()};
                    }
                    double base = check_number(args, 1, "tonumber");
                    if (base < 2 || base > 36 || base != std::floor(base))
                      throw RuntimeFault("invalid argument #2 to 'tonumber' (base out of range)");
                    if (!v.isString() && !v.isNumber())
                      return ValueList{Value()};
                    auto n = parse_in_base(toString(v), (int)base);
                    return ValueList{n ? Value(*n) : Value()};
                  }));

    env->setField("error", makeNative("error", [](const ValueList &args) -> ValueList {
                    throw ScriptError(arg(args, 0));
                  }));

    env->setField("assert", makeNative("assert", [](const ValueList &args) {
                    if (!arg(args, 0).truthy()) {
                      if (args.size() > 1)
                        throw ScriptError(args[1]);
                      throw ScriptError(Value("assertion failed!"));
                    }
                    return args;
                  }));

    env->setField("next", next);

    env->setField("pairs", makeNative("pairs", [next](const ValueList &args) {
                    const TableRef &t = check_table(args, 0, "pairs");
                    return ValueList{next, t, Value()};
                  }));

    env->setField("ipairs", makeNative("ipairs", [ipairs_step](const ValueList &args) {
                    const TableRef &t = check_table(args, 0, "ipairs");
                    return ValueList{ipairs_step, t, 0.0};
                  }));

    env->setField("select", makeNative("select", [](const ValueList &args) {
                    const Value &n = arg(args, 0);
                    long long count = args.empty() ? 0 : (long long)args.size() - 1;
                    if (n.isString() && n.asString() == "#")
                      return ValueList{(double)count};
                    long long i = (long long)check_number(args, 0, "select");
                    if (i < 0)
                      i = count + i + 1;
                    if (i < 1)
                      throw RuntimeFault("invalid argument #1 to 'select' (index out of range)");
                    if (i > count)
                      return ValueList{};
                    return ValueList(args.begin() + i, args.end());
                  }));

    env->setField("pcall", makeNative("pcall", [](const ValueList &args) {
                    ValueList rest(args.empty() ? args.end() : args.begin() + 1, args.end());
                    CallResult r = protectedCall(arg(args, 0), rest);
                    ValueList out{r.ok};
                    if (r.ok)
                      out.insert(out.end(), r.values.begin(), r.values.end());
                    else
                      out.push_back(r.error);
                    return out;
                  }));

    env->setField("rawequal", makeNative("rawequal", [](const ValueList &args) {
                    return ValueList{arg(args, 0) == arg(args, 1)};
                  }));

    env->setField("rawlen", makeNative("rawlen", [](const ValueList &args) {
                    const Value &v = arg(args, 0);
                    if (v.isString())
                      return ValueList{(double)v.asString().size()};
                    return ValueList{(double)check_table(args, 0, "rawlen")->length()};
                  }));
  }

} // namespace bcvm
