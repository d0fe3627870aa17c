#include "value.hpp"
#include "function.hpp"
#include "table.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fmt/core.h>
#include <functional>

namespace bcvm {

  const char *typeName(ValueType t) {
    switch (t) {
    case ValueType::Nil:
      return "nil";
    case ValueType::Boolean:
      return "boolean";
    case ValueType::Number:
      return "number";
    case ValueType::String:
      return "string";
    case ValueType::Vector:
      return "vector";
    case ValueType::Table:
      return "table";
    case ValueType::Function:
      return "function";
    }
    return "unknown";
  }

  bool Value::operator==(const Value &o) const {
    if (type() != o.type())
      return false;
    switch (type()) {
    case ValueType::Nil:
      return true;
    case ValueType::Boolean:
      return asBoolean() == o.asBoolean();
    case ValueType::Number:
      return asNumber() == o.asNumber();
    case ValueType::String:
      return stringRef() == o.stringRef() || asString() == o.asString();
    case ValueType::Vector:
      return asVector() == o.asVector();
    case ValueType::Table:
      return asTable() == o.asTable();
    case ValueType::Function:
      return asFunction() == o.asFunction();
    }
    return false;
  }

  std::size_t Value::hash() const {
    switch (type()) {
    case ValueType::Nil:
      return 0;
    case ValueType::Boolean:
      return asBoolean() ? 1 : 2;
    case ValueType::Number: {
      double n = asNumber();
      if (n == 0)
        n = 0; // +0 and -0 compare equal
      return std::hash<double>{}(n);
    }
    case ValueType::String:
      return std::hash<std::string>{}(asString());
    case ValueType::Vector: {
      auto &v = asVector();
      std::size_t h = std::hash<float>{}(v.x);
      h ^= std::hash<float>{}(v.y) + 0x9e3779b9 + (h << 6) + (h >> 2);
      h ^= std::hash<float>{}(v.z) + 0x9e3779b9 + (h << 6) + (h >> 2);
      h ^= std::hash<float>{}(v.w) + 0x9e3779b9 + (h << 6) + (h >> 2);
      return h;
    }
    case ValueType::Table:
      return std::hash<const void *>{}(asTable().get());
    case ValueType::Function:
      return std::hash<const void *>{}(asFunction().get());
    }
    return 0;
  }

  static bool parse_number(const std::string &s, double &out) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b]))
      ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1]))
      --e;
    if (b == e)
      return false;
    std::string body = s.substr(b, e - b);
    char *end        = nullptr;
    std::size_t sign = (body[0] == '-' || body[0] == '+') ? 1 : 0;
    if (body.size() > sign + 2 && body[sign] == '0' && (body[sign + 1] == 'x' || body[sign + 1] == 'X')) {
      unsigned long long v = std::strtoull(body.c_str() + sign + 2, &end, 16);
      if (end != body.c_str() + body.size())
        return false;
      out = body[0] == '-' ? -(double)v : (double)v;
      return true;
    }
    out = std::strtod(body.c_str(), &end);
    return end == body.c_str() + body.size();
  }

  std::optional<double> toNumber(const Value &v) {
    if (v.isNumber())
      return v.asNumber();
    if (v.isString()) {
      double d = 0;
      if (parse_number(v.asString(), d))
        return d;
    }
    return std::nullopt;
  }

  std::string formatNumber(double n) {
    if (std::isnan(n))
      return "nan";
    if (std::isinf(n))
      return n > 0 ? "inf" : "-inf";
    if (n == std::floor(n) && std::fabs(n) < 1e15)
      return fmt::format("{}", (long long)n);
    return fmt::format("{:.14g}", n);
  }

  std::string toString(const Value &v) {
    switch (v.type()) {
    case ValueType::Nil:
      return "nil";
    case ValueType::Boolean:
      return v.asBoolean() ? "true" : "false";
    case ValueType::Number:
      return formatNumber(v.asNumber());
    case ValueType::String:
      return v.asString();
    case ValueType::Vector: {
      auto &vec = v.asVector();
      return fmt::format("{}, {}, {}", formatNumber(vec.x), formatNumber(vec.y), formatNumber(vec.z));
    }
    case ValueType::Table:
      return fmt::format("table: {}", (const void *)v.asTable().get());
    case ValueType::Function:
      return fmt::format("function: {}", (const void *)v.asFunction().get());
    }
    return "?";
  }

} // namespace bcvm
