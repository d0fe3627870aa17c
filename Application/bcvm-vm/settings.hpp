#pragma once
#include "../../Domain/bcvm-bytecode/module.hpp"
#include "../../Domain/bcvm-core/value.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace bcvm {

  // Snapshot of the running frame handed to instrumentation callbacks.
  struct HookContext {
    const Prototype &proto;
    const ValueList &registers;
    uint32_t pc; // slot of the instruction being executed
    int top;
    const char *opname;
  };

  struct Hooks {
    std::function<void(const HookContext &)> step;
    // returning values makes the frame return them immediately
    std::function<std::optional<ValueList>(const HookContext &)> breakpoint;
    // called before calls, returns, backward jumps and loop continuations
    std::function<void(const HookContext &)> interrupt;
    // called once per uncaught fault when error handling is enabled. `error` is
    // the value the host will catch: the located message, or the raw payload
    // when proxy errors are allowed (`message` is then its type name).
    std::function<void(const std::string &message, const Value &error, const HookContext &)> panic;
  };

  // Returns the call results when the handler takes over the call, nullopt to
  // fall back to a table lookup. `args` starts with the receiver.
  using NamecallHandler = std::function<std::optional<ValueList>(const std::string &method, const ValueList &args)>;
  using VectorCtor      = std::function<Value(float x, float y, float z, float w)>;

  struct Settings {
    int vectorSize{3}; // 3 or 4 components for vector constants
    VectorCtor vectorCtor;

    uint32_t maxRegisters{16384};
    uint32_t maxCallDepth{200};

    bool generalizedIteration{true};

    // wrap closures: locate, report to the panic hook, re-raise as ScriptError
    bool errorHandling{true};
    bool allowProxyErrors{false};

    bool useNativeNamecall{false};
    NamecallHandler namecallHandler;
    // re-run the step/interrupt hooks before trying the native handler, even
    // when it declines the call
    bool namecallReinvokesHooks{true};

    // resolve GETIMPORT paths once at load time against staticEnvironment
    bool useImportConstants{false};
    TableRef staticEnvironment;

    TableRef extensions;    // consulted before the global environment
    TableRef stringMethods; // answers key lookups on string receivers

    std::function<uint32_t(uint32_t)> decodeOp;

    Hooks hooks;

    bool trace{false};
    uint64_t traceLimit{0};
  };

} // namespace bcvm
