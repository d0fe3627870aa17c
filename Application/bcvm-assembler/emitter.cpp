#include "emitter.hpp"
#include <cstdint>
#include <cstring>
#include <fmt/core.h>
#include <stdexcept>

namespace bcvm {

  void writeVarInt(std::string &out, uint32_t v) {
    do {
      uint8_t b = v & 0x7F;
      v >>= 7;
      if (v)
        b |= 0x80;
      out.push_back((char)b);
    } while (v);
  }

  void writeWord(std::string &out, uint32_t v) {
    for (int i = 0; i < 4; ++i)
      out.push_back((char)((v >> (i * 8)) & 0xFF));
  }

  static void write_double(std::string &out, double d) {
    uint64_t bits;
    std::memcpy(&bits, &d, sizeof bits);
    for (int i = 0; i < 8; ++i)
      out.push_back((char)((bits >> (i * 8)) & 0xFF));
  }

  static void write_float(std::string &out, float f) {
    uint32_t bits;
    std::memcpy(&bits, &f, sizeof bits);
    writeWord(out, bits);
  }

  ProtoBuilder &ProtoBuilder::name(const std::string &debugName) {
    nameIndex_ = owner_.string(debugName);
    return *this;
  }

  uint32_t ProtoBuilder::push(uint32_t word) {
    code_.push_back(word);
    lines_.push_back(line_);
    return (uint32_t)code_.size() - 1;
  }

  uint32_t ProtoBuilder::op(Op o) {
    return push(o);
  }

  uint32_t ProtoBuilder::abc(Op o, uint8_t a, uint8_t b, uint8_t c) {
    return push((uint32_t)o | ((uint32_t)a << 8) | ((uint32_t)b << 16) | ((uint32_t)c << 24));
  }

  uint32_t ProtoBuilder::ad(Op o, uint8_t a, int16_t d) {
    return push((uint32_t)o | ((uint32_t)a << 8) | ((uint32_t)(uint16_t)d << 16));
  }

  uint32_t ProtoBuilder::e(Op o, int32_t e) {
    return push((uint32_t)o | (((uint32_t)e & 0xFFFFFF) << 8));
  }

  uint32_t ProtoBuilder::abcAux(Op o, uint8_t a, uint8_t b, uint8_t c, uint32_t aux) {
    uint32_t slot = abc(o, a, b, c);
    push(aux);
    return slot;
  }

  uint32_t ProtoBuilder::adAux(Op o, uint8_t a, int16_t d, uint32_t aux) {
    uint32_t slot = ad(o, a, d);
    push(aux);
    return slot;
  }

  void ProtoBuilder::patchD(uint32_t slot, uint32_t target) {
    int32_t d = (int32_t)target - (int32_t)(slot + 1);
    if (d < INT16_MIN || d > INT16_MAX)
      throw std::out_of_range(fmt::format("jump from {} to {} does not fit in D", slot, target));
    code_.at(slot) = (code_[slot] & 0xFFFF) | ((uint32_t)(uint16_t)(int16_t)d << 16);
  }

  void ProtoBuilder::patchE(uint32_t slot, uint32_t target) {
    int32_t e = (int32_t)target - (int32_t)(slot + 1);
    code_.at(slot) = (code_[slot] & 0xFF) | (((uint32_t)e & 0xFFFFFF) << 8);
  }

  uint32_t ProtoBuilder::addConst(Const k) {
    consts_.push_back(std::move(k));
    return (uint32_t)consts_.size() - 1;
  }

  uint32_t ProtoBuilder::constNil() {
    return addConst(Const{0});
  }

  uint32_t ProtoBuilder::constBool(bool b) {
    Const k{1};
    k.b = b;
    return addConst(std::move(k));
  }

  uint32_t ProtoBuilder::constNumber(double n) {
    Const k{2};
    k.n = n;
    return addConst(std::move(k));
  }

  uint32_t ProtoBuilder::constString(const std::string &s) {
    Const k{3};
    k.ref = owner_.string(s);
    return addConst(std::move(k));
  }

  uint32_t ProtoBuilder::constImport(uint32_t id) {
    Const k{4};
    k.ref = id;
    return addConst(std::move(k));
  }

  uint32_t ProtoBuilder::constTable(const std::vector<uint32_t> &keys) {
    Const k{5};
    k.keys = keys;
    return addConst(std::move(k));
  }

  uint32_t ProtoBuilder::constClosure(uint32_t protoIndex) {
    Const k{6};
    k.ref = protoIndex;
    return addConst(std::move(k));
  }

  uint32_t ProtoBuilder::constVector(const Vector &v) {
    Const k{7};
    k.vec = v;
    return addConst(std::move(k));
  }

  uint32_t ProtoBuilder::child(uint32_t protoIndex) {
    children_.push_back(protoIndex);
    return (uint32_t)children_.size() - 1;
  }

  uint32_t ProtoBuilder::importId(uint32_t k0) {
    return (1u << 30) | (k0 << 20);
  }

  uint32_t ProtoBuilder::importId(uint32_t k0, uint32_t k1) {
    return (2u << 30) | (k0 << 20) | (k1 << 10);
  }

  uint32_t ProtoBuilder::importId(uint32_t k0, uint32_t k1, uint32_t k2) {
    return (3u << 30) | (k0 << 20) | (k1 << 10) | k2;
  }

  void ProtoBuilder::write(std::string &out, uint8_t version) const {
    out.push_back((char)maxStack_);
    out.push_back((char)numParams_);
    out.push_back((char)numUpvalues_);
    out.push_back((char)(isVararg_ ? 1 : 0));
    if (version >= 4) {
      out.push_back(0); // flags
      writeVarInt(out, 0); // type info
    }

    writeVarInt(out, (uint32_t)code_.size());
    for (uint32_t w : code_)
      writeWord(out, w);

    writeVarInt(out, (uint32_t)consts_.size());
    for (const auto &k : consts_) {
      out.push_back((char)k.tag);
      switch (k.tag) {
      case 1:
        out.push_back((char)(k.b ? 1 : 0));
        break;
      case 2:
        write_double(out, k.n);
        break;
      case 3:
      case 6:
        writeVarInt(out, k.ref);
        break;
      case 4:
        writeWord(out, k.ref);
        break;
      case 5:
        writeVarInt(out, (uint32_t)k.keys.size());
        for (uint32_t key : k.keys)
          writeVarInt(out, key);
        break;
      case 7:
        write_float(out, k.vec.x);
        write_float(out, k.vec.y);
        write_float(out, k.vec.z);
        write_float(out, k.vec.w);
        break;
      default:
        break;
      }
    }

    writeVarInt(out, (uint32_t)children_.size());
    for (uint32_t c : children_)
      writeVarInt(out, c);

    writeVarInt(out, lineDefined_);
    writeVarInt(out, nameIndex_);

    // one interval per word keeps every offset at zero
    out.push_back((char)(withLines_ ? 1 : 0));
    if (withLines_) {
      out.push_back(0); // gap log2
      for (std::size_t i = 0; i < code_.size(); ++i)
        out.push_back(0);
      int last = 0;
      for (int l : lines_) {
        writeWord(out, (uint32_t)(l - last));
        last = l;
      }
    }
    out.push_back(0); // no debug info
  }

  ProtoBuilder &ModuleBuilder::proto() {
    protos_.push_back(std::make_unique<ProtoBuilder>(*this, (uint32_t)protos_.size()));
    return *protos_.back();
  }

  uint32_t ModuleBuilder::string(const std::string &s) {
    auto it = stringIndex_.find(s);
    if (it != stringIndex_.end())
      return it->second;
    strings_.push_back(s);
    uint32_t index = (uint32_t)strings_.size();
    stringIndex_.emplace(s, index);
    return index;
  }

  std::string ModuleBuilder::serialize(uint8_t version, uint8_t typesVersion) const {
    std::string out;
    out.push_back((char)version);
    if (version >= 4)
      out.push_back((char)typesVersion);

    writeVarInt(out, (uint32_t)strings_.size());
    for (const auto &s : strings_) {
      writeVarInt(out, (uint32_t)s.size());
      out += s;
    }
    if (version >= 4 && typesVersion == 3)
      out.push_back(0); // empty userdata remap

    writeVarInt(out, (uint32_t)protos_.size());
    for (const auto &p : protos_)
      p->write(out, version);
    writeVarInt(out, main_);
    return out;
  }

} // namespace bcvm
