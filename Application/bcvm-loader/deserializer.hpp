#pragma once
#include "../../Domain/bcvm-bytecode/cursor.hpp"
#include "../../Domain/bcvm-bytecode/module.hpp"
#include "../bcvm-vm/settings.hpp"
#include <memory>
#include <string_view>

namespace bcvm {

  inline constexpr uint8_t kMinBytecodeVersion = 3;
  inline constexpr uint8_t kMaxBytecodeVersion = 6;

  class Deserializer {
  public:
    Deserializer(std::string_view bytes, const Settings &settings) : cur_(bytes), settings_(settings) {}

    // Throws CorruptBytecode or UnsupportedOpcode; never returns a partial module.
    std::shared_ptr<Module> run();

  private:
    Prototype readProto(uint32_t index);
    bool readInstruction(Prototype &p);
    Constant readConstant();
    void resolveConstants(Prototype &p);
    const Constant &constantAt(const Prototype &p, int64_t index) const;
    void readLineInfo(Prototype &p);
    void skipDebugInfo();
    const std::string &stringAt(uint32_t index) const;

    Cursor cur_;
    const Settings &settings_;
    std::shared_ptr<Module> mod_;
  };

  std::shared_ptr<Module> deserialize(std::string_view bytes, const Settings &settings = Settings{});

} // namespace bcvm
