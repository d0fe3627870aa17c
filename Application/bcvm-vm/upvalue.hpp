#pragma once
#include "../../Domain/bcvm-core/value.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <variant>

namespace bcvm {

  // A variable shared between a live frame and the closures that captured it.
  // Open upvalues alias a register slot; closing copies the value out. The
  // transition is one-way.
  class Upvalue {
  public:
    struct Open {
      ValueList *registers;
      uint32_t slot;
    };

    explicit Upvalue(Open open) : state_(open) {}
    explicit Upvalue(Value closed) : state_(std::move(closed)) {}

    Upvalue(const Upvalue &)            = delete;
    Upvalue &operator=(const Upvalue &) = delete;

    const Value &get() const;
    void set(Value v);
    void close();

    bool isOpen() const {
      return std::holds_alternative<Open>(state_);
    }
    uint32_t slot() const {
      return std::get<Open>(state_).slot;
    }

  private:
    std::variant<Open, Value> state_;
  };

  using UpvalueRef = std::shared_ptr<Upvalue>;

  // Open upvalues of one frame, ordered by register slot.
  class UpvalueRegistry {
  public:
    explicit UpvalueRegistry(ValueList &registers) : registers_(registers) {}
    ~UpvalueRegistry() {
      closeFrom(0);
    }

    UpvalueRegistry(const UpvalueRegistry &)            = delete;
    UpvalueRegistry &operator=(const UpvalueRegistry &) = delete;

    // Existing open entry for the slot, or a new one aliasing it.
    UpvalueRef open(uint32_t slot);
    // Closes and forgets every entry with slot >= minSlot.
    void closeFrom(uint32_t minSlot);

    std::size_t size() const {
      return open_.size();
    }
    bool isOpen(uint32_t slot) const {
      return open_.count(slot) != 0;
    }

  private:
    ValueList &registers_;
    std::map<uint32_t, UpvalueRef> open_;
  };

} // namespace bcvm
