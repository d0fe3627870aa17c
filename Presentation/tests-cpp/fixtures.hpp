#pragma once
#include "../../Application/bcvm-assembler/emitter.hpp"
#include "../../Application/bcvm-loader/deserializer.hpp"
#include "../../Application/bcvm-vm/vm.hpp"
#include "../../Domain/bcvm-core/errors.hpp"
#include "../../Domain/bcvm-core/table.hpp"
#include <memory>
#include <string>

namespace fixtures {

  inline bcvm::TableRef newTable() {
    return std::make_shared<bcvm::Table>();
  }

  inline bcvm::ValueList run(const bcvm::ModuleBuilder &mb, bcvm::TableRef env = newTable(),
                             bcvm::Settings settings = bcvm::Settings{}, const bcvm::ValueList &args = {}) {
    auto entry = bcvm::load(mb.serialize(), std::move(env), std::move(settings));
    return entry.main->call(args);
  }

  // for i = 1, n do sum += i end; return sum
  inline void sumLoop(bcvm::ProtoBuilder &p, int16_t n) {
    p.maxStack(4);
    p.ad(bcvm::OP_LOADN, 0, 0);
    p.ad(bcvm::OP_LOADN, 1, n);
    p.ad(bcvm::OP_LOADN, 2, 1);
    p.ad(bcvm::OP_LOADN, 3, 1);
    uint32_t prep = p.ad(bcvm::OP_FORNPREP, 1, 0);
    uint32_t body = p.abc(bcvm::OP_ADD, 0, 0, 3);
    uint32_t loop = p.ad(bcvm::OP_FORNLOOP, 1, 0);
    p.patchD(loop, body);
    uint32_t exit = p.abc(bcvm::OP_RETURN, 0, 2);
    p.patchD(prep, exit);
  }

  inline std::string faultMessage(const bcvm::ModuleBuilder &mb, bcvm::TableRef env = newTable(),
                                  bcvm::Settings settings = bcvm::Settings{}) {
    try {
      run(mb, std::move(env), std::move(settings));
    } catch (const bcvm::VmError &e) {
      return e.what();
    }
    return "<no error>";
  }

} // namespace fixtures
