#pragma once
#include "../../Domain/bcvm-bytecode/module.hpp"
#include "../../Domain/bcvm-core/function.hpp"
#include "closure.hpp"
#include "frame.hpp"
#include "settings.hpp"
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace bcvm {

  // Register-based interpreter for one loaded module. The host keeps it alive
  // through Entry; closures only refer to it weakly. close() stops every
  // running and future invocation.
  class VM : public std::enable_shared_from_this<VM> {
  public:
    VM(std::shared_ptr<Module> module, TableRef env, Settings settings);

    // Closure over the module's main prototype.
    std::shared_ptr<Closure> mainClosure();

    // Runs one closure invocation. Called through Closure::call.
    ValueList invoke(Closure &closure, const ValueList &args);

    void close() {
      alive_ = false;
    }
    bool alive() const {
      return alive_;
    }

    Module &module() {
      return *module_;
    }
    const std::shared_ptr<Module> &sharedModule() const {
      return module_;
    }
    const TableRef &env() const {
      return env_;
    }
    const Settings &settings() const {
      return settings_;
    }
    uint32_t depth() const {
      return depth_;
    }

  private:
    ValueList execute(Closure &closure, CallFrame &frame);

    std::vector<UpvalueRef> capture(CallFrame &frame, Closure &parent, const Prototype &child, bool allowRef);
    void storeResults(CallFrame &frame, uint32_t base, uint32_t wanted, const ValueList &results);
    bool namecall(CallFrame &frame, const Instruction &inst);

    Value getGlobal(const Value &key) const;
    void setGlobal(const Value &key, Value v);
    Value index(const Value &obj, const Value &key) const;
    void setIndex(const Value &obj, const Value &key, Value v);
    ValueList callValue(const Value &fn, const ValueList &args);

    HookContext context(const CallFrame &frame, uint8_t op) const;
    void interrupt(const CallFrame &frame, uint8_t op);
    void trace(const CallFrame &frame, const Instruction &inst);
    std::string locate(const CallFrame &frame, const std::string &message) const;
    [[noreturn]] void raise(const CallFrame &frame, const Value &payload);

    std::shared_ptr<Module> module_;
    TableRef env_;
    Settings settings_;
    bool alive_{true};
    uint32_t depth_{0};
    uint64_t traced_{0};
  };

  // Result of load(): the callable main closure plus a handle that stops the VM.
  // Closures stop working once the last Entry copy holding `vm` is dropped.
  struct Entry {
    FunctionRef main;
    std::function<void()> close;
    std::shared_ptr<VM> vm;
  };

  Entry load(std::shared_ptr<Module> module, TableRef env, Settings settings = Settings{});
  // Deserializes then loads; import constants resolve against `settings`.
  Entry load(std::string_view bytecode, TableRef env, Settings settings = Settings{});

  struct CallResult {
    bool ok{false};
    ValueList values;
    Value error; // error payload when !ok
    std::string message;
  };

  // Calls fn, converting VM errors into a failed CallResult.
  CallResult protectedCall(const Value &fn, const ValueList &args);

} // namespace bcvm
