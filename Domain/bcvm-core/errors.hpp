#pragma once
#include "value.hpp"
#include <stdexcept>
#include <string>

namespace bcvm {

  class VmError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // bad version, truncated read, trailing bytes, out-of-range index
  class CorruptBytecode : public VmError {
  public:
    using VmError::VmError;
  };

  class UnsupportedOpcode : public VmError {
  public:
    UnsupportedOpcode(uint32_t opcode, const std::string &what) : VmError(what), opcode_(opcode) {}
    uint32_t opcode() const {
      return opcode_;
    }

  private:
    uint32_t opcode_{0};
  };

  class RuntimeFault : public VmError {
  public:
    using VmError::VmError;
  };

  // Error raised with a script value as payload (the `error` builtin, or a fault
  // re-raised by a closure running in error-handling mode).
  class ScriptError : public VmError {
  public:
    explicit ScriptError(Value payload, bool reported = false)
        : VmError(payload.isString() ? payload.asString() : std::string("(error object is a ") + typeName(payload.type()) + " value)"),
          payload_(std::move(payload)), reported_(reported) {}

    const Value &payload() const {
      return payload_;
    }
    // true once a panic hook has seen this error
    bool reported() const {
      return reported_;
    }

  private:
    Value payload_;
    bool reported_{false};
  };

} // namespace bcvm
