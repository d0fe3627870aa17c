#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace bcvm {

  class Table;
  class Function;

  using TableRef    = std::shared_ptr<Table>;
  using FunctionRef = std::shared_ptr<Function>;
  using StringRef   = std::shared_ptr<const std::string>;

  enum class ValueType : uint8_t {
    Nil,
    Boolean,
    Number,
    String,
    Vector,
    Table,
    Function,
  };

  const char *typeName(ValueType t);

  struct Vector {
    float x{0}, y{0}, z{0}, w{0};

    bool operator==(const Vector &o) const {
      return x == o.x && y == o.y && z == o.z && w == o.w;
    }
  };

  class Value {
  public:
    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : v_(b) {}
    Value(double n) : v_(n) {}
    Value(int n) : v_((double)n) {}
    Value(const char *s) : v_(std::make_shared<const std::string>(s)) {}
    Value(std::string s) : v_(std::make_shared<const std::string>(std::move(s))) {}
    Value(StringRef s) : v_(std::move(s)) {}
    Value(Vector vec) : v_(vec) {}
    Value(TableRef t) : v_(std::move(t)) {}
    Value(FunctionRef f) : v_(std::move(f)) {}
    template <typename F, typename = std::enable_if_t<std::is_base_of_v<Function, F>>>
    Value(std::shared_ptr<F> f) : v_(FunctionRef(std::move(f))) {}

    ValueType type() const {
      return (ValueType)v_.index();
    }

    bool isNil() const { return type() == ValueType::Nil; }
    bool isBoolean() const { return type() == ValueType::Boolean; }
    bool isNumber() const { return type() == ValueType::Number; }
    bool isString() const { return type() == ValueType::String; }
    bool isVector() const { return type() == ValueType::Vector; }
    bool isTable() const { return type() == ValueType::Table; }
    bool isFunction() const { return type() == ValueType::Function; }

    // nil and false are the only falsy values
    bool truthy() const {
      if (isNil())
        return false;
      if (isBoolean())
        return std::get<bool>(v_);
      return true;
    }

    bool asBoolean() const { return std::get<bool>(v_); }
    double asNumber() const { return std::get<double>(v_); }
    const std::string &asString() const { return *std::get<StringRef>(v_); }
    const StringRef &stringRef() const { return std::get<StringRef>(v_); }
    const Vector &asVector() const { return std::get<Vector>(v_); }
    const TableRef &asTable() const { return std::get<TableRef>(v_); }
    const FunctionRef &asFunction() const { return std::get<FunctionRef>(v_); }

    // raw equality: by value for primitives and strings, by identity otherwise
    bool operator==(const Value &o) const;
    bool operator!=(const Value &o) const {
      return !(*this == o);
    }

    std::size_t hash() const;

  private:
    std::variant<std::monostate, bool, double, StringRef, Vector, TableRef, FunctionRef> v_;
  };

  using ValueList = std::vector<Value>;

  struct ValueHash {
    std::size_t operator()(const Value &v) const {
      return v.hash();
    }
  };

  // Numbers pass through; strings must parse completely as a decimal or hex number.
  std::optional<double> toNumber(const Value &v);
  // Script-visible string form used by tostring, print and CONCAT.
  std::string toString(const Value &v);
  std::string formatNumber(double n);

} // namespace bcvm
