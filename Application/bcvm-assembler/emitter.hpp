#pragma once
#include "../../Domain/bcvm-bytecode/opcodes.hpp"
#include "../../Domain/bcvm-core/value.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace bcvm {

  class ModuleBuilder;

  // Emits one prototype. Every emit returns the code slot of the instruction;
  // aux words occupy the following slot.
  class ProtoBuilder {
  public:
    ProtoBuilder(ModuleBuilder &owner, uint32_t index) : owner_(owner), index_(index) {}

    uint32_t index() const { return index_; }

    ProtoBuilder &params(uint8_t n, bool vararg = false) {
      numParams_ = n;
      isVararg_  = vararg;
      return *this;
    }
    ProtoBuilder &maxStack(uint8_t n) {
      maxStack_ = n;
      return *this;
    }
    ProtoBuilder &upvalues(uint8_t n) {
      numUpvalues_ = n;
      return *this;
    }
    ProtoBuilder &name(const std::string &debugName);
    ProtoBuilder &lineDefined(uint32_t line) {
      lineDefined_ = line;
      return *this;
    }
    // source line recorded for subsequently emitted words; enables line info
    ProtoBuilder &line(int l) {
      line_      = l;
      withLines_ = true;
      return *this;
    }

    uint32_t op(Op o);
    uint32_t abc(Op o, uint8_t a, uint8_t b = 0, uint8_t c = 0);
    uint32_t ad(Op o, uint8_t a, int16_t d);
    uint32_t e(Op o, int32_t e);
    uint32_t abcAux(Op o, uint8_t a, uint8_t b, uint8_t c, uint32_t aux);
    uint32_t adAux(Op o, uint8_t a, int16_t d, uint32_t aux);
    uint32_t capture(CaptureType type, uint8_t index) {
      return abc(OP_CAPTURE, (uint8_t)type, index, 0);
    }

    uint32_t here() const { return (uint32_t)code_.size(); }
    // jump operand of `slot` so that it lands on `target`
    void patchD(uint32_t slot, uint32_t target);
    void patchE(uint32_t slot, uint32_t target);

    uint32_t constNil();
    uint32_t constBool(bool b);
    uint32_t constNumber(double n);
    uint32_t constString(const std::string &s);
    uint32_t constImport(uint32_t id);
    uint32_t constTable(const std::vector<uint32_t> &keys);
    uint32_t constClosure(uint32_t protoIndex);
    uint32_t constVector(const Vector &v);

    // child prototype slot for NEWCLOSURE
    uint32_t child(uint32_t protoIndex);

    // GETIMPORT aux word for a path of 1-3 constant indices
    static uint32_t importId(uint32_t k0);
    static uint32_t importId(uint32_t k0, uint32_t k1);
    static uint32_t importId(uint32_t k0, uint32_t k1, uint32_t k2);

    void write(std::string &out, uint8_t version) const;

  private:
    struct Const {
      uint8_t tag{0};
      bool b{false};
      double n{0};
      uint32_t ref{0};
      std::vector<uint32_t> keys;
      Vector vec;
    };

    uint32_t push(uint32_t word);
    uint32_t addConst(Const k);

    ModuleBuilder &owner_;
    uint32_t index_{0};
    uint8_t maxStack_{0}, numParams_{0}, numUpvalues_{0};
    bool isVararg_{false};
    uint32_t lineDefined_{0};
    uint32_t nameIndex_{0};
    int line_{0};
    bool withLines_{false};

    std::vector<uint32_t> code_;
    std::vector<int> lines_;
    std::vector<Const> consts_;
    std::vector<uint32_t> children_;
  };

  // Builds a complete bytecode module in the wire format the deserializer reads.
  class ModuleBuilder {
  public:
    ProtoBuilder &proto();
    ProtoBuilder &proto(uint32_t index) { return *protos_.at(index); }
    void setMain(uint32_t index) { main_ = index; }

    // 1-based string table index, deduplicated
    uint32_t string(const std::string &s);

    std::string serialize(uint8_t version = 5, uint8_t typesVersion = 1) const;

  private:
    std::vector<std::unique_ptr<ProtoBuilder>> protos_;
    std::vector<std::string> strings_;
    std::unordered_map<std::string, uint32_t> stringIndex_;
    uint32_t main_{0};
  };

  void writeVarInt(std::string &out, uint32_t v);
  void writeWord(std::string &out, uint32_t v);

} // namespace bcvm
