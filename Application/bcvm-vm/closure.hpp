#pragma once
#include "../../Domain/bcvm-bytecode/module.hpp"
#include "../../Domain/bcvm-core/function.hpp"
#include "upvalue.hpp"
#include <memory>
#include <vector>

namespace bcvm {

  class VM;

  // A prototype bound to its captured upvalues. The closure keeps its module
  // alive but not its VM: scripts store closures in the environment the VM
  // owns. Calling a closure whose VM has been released is a RuntimeFault.
  class Closure final : public Function {
  public:
    Closure(const std::shared_ptr<VM> &vm, std::shared_ptr<Module> module, Prototype &proto,
            std::vector<UpvalueRef> upvalues)
        : vm_(vm), module_(std::move(module)), proto_(proto), upvalues_(std::move(upvalues)) {}

    ValueList call(const ValueList &args) override;
    const std::string &name() const override {
      return proto_.debugName;
    }

    Prototype &proto() const {
      return proto_;
    }
    const std::vector<UpvalueRef> &upvalues() const {
      return upvalues_;
    }

  private:
    std::weak_ptr<VM> vm_;
    std::shared_ptr<Module> module_;
    Prototype &proto_;
    std::vector<UpvalueRef> upvalues_;
  };

  std::shared_ptr<Closure> makeClosure(const std::shared_ptr<VM> &vm, Prototype &proto, std::vector<UpvalueRef> upvalues);

} // namespace bcvm
