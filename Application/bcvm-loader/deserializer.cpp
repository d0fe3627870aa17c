#include "deserializer.hpp"
#include "../../Domain/bcvm-core/errors.hpp"
#include "../../Domain/bcvm-core/table.hpp"
#include <algorithm>
#include <fmt/core.h>

namespace bcvm {

  static Value resolve_import(const TableRef &env, const ImportPath &path) {
    if (!env || path.k0.isNil())
      return Value();
    Value res = env->get(path.k0);
    if (path.count < 2 || !res.isTable())
      return path.count < 2 ? res : Value();
    res = res.asTable()->get(path.k1);
    if (path.count < 3 || !res.isTable())
      return path.count < 3 ? res : Value();
    return res.asTable()->get(path.k2);
  }

  std::shared_ptr<Module> deserialize(std::string_view bytes, const Settings &settings) {
    return Deserializer(bytes, settings).run();
  }

  std::shared_ptr<Module> Deserializer::run() {
    mod_ = std::make_shared<Module>();

    uint8_t version = cur_.readByte();
    if (version == 0)
      throw CorruptBytecode("bytecode version 0: the buffer holds a compile error, not a module");
    if (version < kMinBytecodeVersion || version > kMaxBytecodeVersion)
      throw CorruptBytecode(fmt::format("bytecode version {} outside supported range [{}, {}]", version,
                                        kMinBytecodeVersion, kMaxBytecodeVersion));
    mod_->version = version;
    if (version >= 4)
      mod_->typesVersion = cur_.readByte();

    uint32_t stringCount = cur_.readVarInt();
    mod_->strings.reserve(std::min<std::size_t>(stringCount, cur_.remaining()));
    for (uint32_t i = 0; i < stringCount; ++i)
      mod_->strings.push_back(cur_.readString());

    // userdata type remapping, not needed for execution
    if (mod_->typesVersion == 3) {
      uint8_t index = cur_.readByte();
      while (index != 0) {
        (void)cur_.readVarInt();
        index = cur_.readByte();
      }
    }

    uint32_t protoCount = cur_.readVarInt();
    mod_->protos.reserve(std::min<std::size_t>(protoCount, cur_.remaining()));
    for (uint32_t i = 0; i < protoCount; ++i)
      mod_->protos.push_back(readProto(i));

    for (const auto &p : mod_->protos) {
      for (auto child : p.children)
        if (child >= protoCount)
          throw CorruptBytecode(fmt::format("prototype {} references missing child {}", p.index, child));
      for (const auto &k : p.constants)
        if (k.kind == ConstantKind::Closure && k.proto >= protoCount)
          throw CorruptBytecode(fmt::format("prototype {} references missing closure {}", p.index, k.proto));
    }

    uint32_t mainIndex = cur_.readVarInt();
    if (mainIndex >= protoCount)
      throw CorruptBytecode(fmt::format("root prototype {} out of range ({} prototypes)", mainIndex, protoCount));
    mod_->mainIndex = mainIndex;

    if (!cur_.atEnd())
      throw CorruptBytecode(fmt::format("{} trailing bytes after module", cur_.size() - cur_.position()));

    mod_->main().debugName = "(main)";
    return std::move(mod_);
  }

  const std::string &Deserializer::stringAt(uint32_t index) const {
    if (index == 0 || index > mod_->strings.size())
      throw CorruptBytecode(fmt::format("string index {} out of range", index));
    return mod_->strings[index - 1];
  }

  Prototype Deserializer::readProto(uint32_t index) {
    Prototype p;
    p.index        = index;
    p.maxStackSize = cur_.readByte();
    p.numParams    = cur_.readByte();
    p.numUpvalues  = cur_.readByte();
    p.isVararg     = cur_.readByte() != 0;

    if (mod_->version >= 4) {
      p.flags           = cur_.readByte();
      uint32_t typeSize = cur_.readVarInt();
      cur_.skip(typeSize);
    }

    uint32_t sizecode = cur_.readVarInt();
    p.code.reserve(std::min<std::size_t>(sizecode, cur_.remaining() / 4));
    bool skipNext = false;
    for (uint32_t i = 0; i < sizecode; ++i) {
      if (skipNext) {
        skipNext = false;
        continue;
      }
      skipNext = readInstruction(p);
    }
    if (p.code.size() != sizecode)
      throw CorruptBytecode(fmt::format("prototype {}: aux word runs past {} code words", index, sizecode));

    uint32_t sizek = cur_.readVarInt();
    p.constants.reserve(std::min<std::size_t>(sizek, cur_.remaining()));
    for (uint32_t i = 0; i < sizek; ++i)
      p.constants.push_back(readConstant());

    resolveConstants(p);

    uint32_t sizep = cur_.readVarInt();
    p.children.reserve(std::min<std::size_t>(sizep, cur_.remaining()));
    for (uint32_t i = 0; i < sizep; ++i)
      p.children.push_back(cur_.readVarInt());

    p.lineDefined      = cur_.readVarInt();
    uint32_t nameIndex = cur_.readVarInt();
    p.debugName        = nameIndex == 0 ? std::string("(??)") : stringAt(nameIndex);

    if (cur_.readByte() != 0)
      readLineInfo(p);
    if (cur_.readByte() != 0)
      skipDebugInfo();

    return p;
  }

  bool Deserializer::readInstruction(Prototype &p) {
    uint32_t word = cur_.readWord();
    if (settings_.decodeOp)
      word = settings_.decodeOp(word);

    uint32_t op = word & 0xFF;
    if (!isValidOp(op))
      throw UnsupportedOpcode(op, fmt::format("unsupported opcode {} at pc {} in prototype {}", op, p.code.size(), p.index));

    const OpInfo &info = opInfo((uint8_t)op);
    Instruction inst;
    inst.opcode   = (uint8_t)op;
    inst.original = (uint8_t)op;
    inst.mode     = info.mode;
    inst.kmode    = info.kmode;
    inst.hasAux   = info.hasAux;
    inst.raw      = word;

    switch (info.mode) {
    case OpMode::None:
      break;
    case OpMode::A:
      inst.A = (uint8_t)(word >> 8);
      break;
    case OpMode::AB:
      inst.A = (uint8_t)(word >> 8);
      inst.B = (uint8_t)(word >> 16);
      break;
    case OpMode::ABC:
      inst.A = (uint8_t)(word >> 8);
      inst.B = (uint8_t)(word >> 16);
      inst.C = (uint8_t)(word >> 24);
      break;
    case OpMode::AD:
      inst.A = (uint8_t)(word >> 8);
      inst.D = (int16_t)(uint16_t)(word >> 16);
      break;
    case OpMode::AE: {
      int32_t e = (int32_t)((word >> 8) & 0xFFFFFF);
      inst.E    = e < 0x800000 ? e : e - 0x1000000;
      break;
    }
    }

    if (!info.hasAux) {
      p.code.push_back(inst);
      return false;
    }

    inst.aux = cur_.readWord();
    Instruction auxSlot;
    auxSlot.isAuxWord = true;
    auxSlot.raw       = inst.aux;
    auxSlot.aux       = inst.aux;
    p.code.push_back(inst);
    p.code.push_back(auxSlot);
    return true;
  }

  Constant Deserializer::readConstant() {
    Constant k;
    uint8_t kind = cur_.readByte();
    switch (kind) {
    case 0:
      k.kind = ConstantKind::Nil;
      break;
    case 1:
      k.kind  = ConstantKind::Boolean;
      k.value = cur_.readByte() != 0;
      break;
    case 2:
      k.kind  = ConstantKind::Number;
      k.value = cur_.readDouble();
      break;
    case 3: {
      k.kind         = ConstantKind::String;
      uint32_t index = cur_.readVarInt();
      if (index != 0)
        k.value = stringAt(index);
      break;
    }
    case 4:
      k.kind   = ConstantKind::Import;
      k.import = cur_.readWord();
      break;
    case 5: {
      k.kind         = ConstantKind::Table;
      uint32_t count = cur_.readVarInt();
      k.keys.reserve(std::min<std::size_t>(count, cur_.remaining()));
      for (uint32_t i = 0; i < count; ++i)
        k.keys.push_back(cur_.readVarInt());
      break;
    }
    case 6:
      k.kind  = ConstantKind::Closure;
      k.proto = cur_.readVarInt();
      break;
    case 7: {
      k.kind  = ConstantKind::Vector;
      float x = cur_.readFloat(), y = cur_.readFloat(), z = cur_.readFloat(), w = cur_.readFloat();
      if (settings_.vectorSize != 4)
        w = 0;
      k.value = settings_.vectorCtor ? settings_.vectorCtor(x, y, z, w) : Value(Vector{x, y, z, w});
      break;
    }
    default:
      throw CorruptBytecode(fmt::format("unknown constant kind {}", kind));
    }
    return k;
  }

  const Constant &Deserializer::constantAt(const Prototype &p, int64_t index) const {
    if (index < 0 || (uint64_t)index >= p.constants.size())
      throw CorruptBytecode(fmt::format("constant {} out of range in prototype {} ({} constants)", index, p.index,
                                        p.constants.size()));
    return p.constants[(std::size_t)index];
  }

  void Deserializer::resolveConstants(Prototype &p) {
    for (auto &inst : p.code) {
      if (inst.isAuxWord)
        continue;
      switch (inst.kmode) {
      case KMode::None:
        break;
      case KMode::Aux:
        inst.K = constantAt(p, inst.aux);
        break;
      case KMode::C:
        inst.K = constantAt(p, inst.C);
        break;
      case KMode::D:
        inst.K = constantAt(p, inst.D);
        break;
      case KMode::B:
        inst.K = constantAt(p, inst.B);
        break;
      case KMode::AuxImport: {
        auto &path = inst.import;
        path.count = (uint8_t)(inst.aux >> 30);
        path.k0    = constantAt(p, (inst.aux >> 20) & 0x3FF).value;
        if (path.count >= 2)
          path.k1 = constantAt(p, (inst.aux >> 10) & 0x3FF).value;
        if (path.count >= 3)
          path.k2 = constantAt(p, inst.aux & 0x3FF).value;
        if (settings_.useImportConstants) {
          path.value    = resolve_import(settings_.staticEnvironment, path);
          path.resolved = !path.value.isNil();
        }
        break;
      }
      case KMode::AuxBoolBit:
        inst.K.kind  = ConstantKind::Boolean;
        inst.K.value = (inst.aux & 1) != 0;
        inst.KN      = (inst.aux >> 31) != 0;
        break;
      case KMode::AuxNumberBits:
        inst.K  = constantAt(p, inst.aux & 0xFFFFFF);
        inst.KN = (inst.aux >> 31) != 0;
        break;
      case KMode::AuxNumberBits16:
        inst.K.kind  = ConstantKind::Number;
        inst.K.value = (double)(inst.aux & 0xF);
        break;
      }
    }
  }

  void Deserializer::readLineInfo(Prototype &p) {
    uint8_t gapLog2 = cur_.readByte();
    if (gapLog2 > 31)
      throw CorruptBytecode(fmt::format("line gap log2 {} too large", gapLog2));

    int sizecode  = (int)p.code.size();
    int intervals = ((sizecode - 1) >> gapLog2) + 1;

    std::vector<uint8_t> offsets((std::size_t)sizecode);
    uint8_t lastOffset = 0;
    for (int i = 0; i < sizecode; ++i) {
      lastOffset += cur_.readByte();
      offsets[(std::size_t)i] = lastOffset;
    }

    std::vector<uint32_t> absLines((std::size_t)std::max(intervals, 0));
    uint32_t lastLine = 0;
    for (int i = 0; i < intervals; ++i) {
      lastLine += cur_.readWord();
      absLines[(std::size_t)i] = lastLine;
    }

    p.lineInfo.resize((std::size_t)sizecode);
    for (int pc = 0; pc < sizecode; ++pc)
      p.lineInfo[(std::size_t)pc] = (int)(absLines[(std::size_t)(pc >> gapLog2)] + offsets[(std::size_t)pc]);
    p.lineInfoEnabled = true;
  }

  void Deserializer::skipDebugInfo() {
    uint32_t sizel = cur_.readVarInt();
    for (uint32_t i = 0; i < sizel; ++i) {
      (void)cur_.readVarInt(); // name
      (void)cur_.readVarInt(); // startpc
      (void)cur_.readVarInt(); // endpc
      (void)cur_.readByte();   // register
    }
    uint32_t sizeupvalues = cur_.readVarInt();
    for (uint32_t i = 0; i < sizeupvalues; ++i)
      (void)cur_.readVarInt();
  }

} // namespace bcvm
