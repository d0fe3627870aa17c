#pragma once
#include "value.hpp"
#include <functional>
#include <string>

namespace bcvm {

  class Function {
  public:
    virtual ~Function() = default;
    virtual ValueList call(const ValueList &args) = 0;
    virtual const std::string &name() const = 0;
  };

  using NativeFn = std::function<ValueList(const ValueList &args)>;

  class NativeFunction final : public Function {
  public:
    NativeFunction(std::string name, NativeFn fn) : name_(std::move(name)), fn_(std::move(fn)) {}
    ValueList call(const ValueList &args) override {
      return fn_(args);
    }
    const std::string &name() const override {
      return name_;
    }

  private:
    std::string name_;
    NativeFn fn_;
  };

  inline FunctionRef makeNative(std::string name, NativeFn fn) {
    return std::make_shared<NativeFunction>(std::move(name), std::move(fn));
  }

  inline const Value &arg(const ValueList &args, std::size_t i) {
    static const Value nil;
    return i < args.size() ? args[i] : nil;
  }

} // namespace bcvm
