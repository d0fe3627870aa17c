#include "closure.hpp"
#include "../../Domain/bcvm-core/errors.hpp"
#include "vm.hpp"
#include <fmt/core.h>

namespace bcvm {

  ValueList Closure::call(const ValueList &args) {
    auto vm = vm_.lock();
    if (!vm)
      throw RuntimeFault(fmt::format("attempt to call {} after its VM was released", proto_.debugName));
    return vm->invoke(*this, args);
  }

  std::shared_ptr<Closure> makeClosure(const std::shared_ptr<VM> &vm, Prototype &proto, std::vector<UpvalueRef> upvalues) {
    return std::make_shared<Closure>(vm, vm->sharedModule(), proto, std::move(upvalues));
  }

} // namespace bcvm
