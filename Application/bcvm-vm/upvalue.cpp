#include "upvalue.hpp"

namespace bcvm {

  const Value &Upvalue::get() const {
    if (auto *o = std::get_if<Open>(&state_))
      return (*o->registers)[o->slot];
    return std::get<Value>(state_);
  }

  void Upvalue::set(Value v) {
    if (auto *o = std::get_if<Open>(&state_)) {
      (*o->registers)[o->slot] = std::move(v);
      return;
    }
    state_ = std::move(v);
  }

  void Upvalue::close() {
    if (auto *o = std::get_if<Open>(&state_)) {
      Value snapshot = (*o->registers)[o->slot];
      state_         = std::move(snapshot);
    }
  }

  UpvalueRef UpvalueRegistry::open(uint32_t slot) {
    auto it = open_.find(slot);
    if (it != open_.end())
      return it->second;
    auto uv = std::make_shared<Upvalue>(Upvalue::Open{&registers_, slot});
    open_.emplace(slot, uv);
    return uv;
  }

  void UpvalueRegistry::closeFrom(uint32_t minSlot) {
    auto it = open_.lower_bound(minSlot);
    while (it != open_.end()) {
      it->second->close();
      it = open_.erase(it);
    }
  }

} // namespace bcvm
