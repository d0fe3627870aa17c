#include "module_json.hpp"
#include "../../Domain/bcvm-core/value.hpp"

namespace bcvm {

  using nlohmann::json;

  static const char *kind_name(ConstantKind k) {
    switch (k) {
    case ConstantKind::Nil:
      return "nil";
    case ConstantKind::Boolean:
      return "boolean";
    case ConstantKind::Number:
      return "number";
    case ConstantKind::String:
      return "string";
    case ConstantKind::Import:
      return "import";
    case ConstantKind::Table:
      return "table";
    case ConstantKind::Closure:
      return "closure";
    case ConstantKind::Vector:
      return "vector";
    }
    return "?";
  }

  static json value_json(const Value &v) {
    switch (v.type()) {
    case ValueType::Nil:
      return nullptr;
    case ValueType::Boolean:
      return v.asBoolean();
    case ValueType::Number:
      return v.asNumber();
    case ValueType::String:
      return v.asString();
    case ValueType::Vector: {
      const Vector &vec = v.asVector();
      return json::array({vec.x, vec.y, vec.z, vec.w});
    }
    default:
      return toString(v);
    }
  }

  static json constant_json(const Constant &k) {
    json j;
    j["kind"] = kind_name(k.kind);
    switch (k.kind) {
    case ConstantKind::Import:
      j["id"] = k.import;
      break;
    case ConstantKind::Table:
      j["keys"] = k.keys;
      break;
    case ConstantKind::Closure:
      j["proto"] = k.proto;
      break;
    default:
      j["value"] = value_json(k.value);
      break;
    }
    return j;
  }

  static json instruction_json(const Prototype &p, uint32_t pc) {
    const Instruction &inst = p.code[pc];
    json j;
    j["pc"] = pc;
    if (inst.isAuxWord) {
      j["aux"] = inst.aux;
      return j;
    }
    j["op"] = opName(inst.opcode);
    switch (inst.mode) {
    case OpMode::None:
      break;
    case OpMode::A:
      j["A"] = inst.A;
      break;
    case OpMode::AB:
      j["A"] = inst.A;
      j["B"] = inst.B;
      break;
    case OpMode::ABC:
      j["A"] = inst.A;
      j["B"] = inst.B;
      j["C"] = inst.C;
      break;
    case OpMode::AD:
      j["A"] = inst.A;
      j["D"] = inst.D;
      break;
    case OpMode::AE:
      j["E"] = inst.E;
      break;
    }
    if (inst.hasAux)
      j["aux"] = inst.aux;
    if (inst.kmode != KMode::None && inst.kmode != KMode::AuxImport)
      j["K"] = value_json(inst.K.value);
    if (inst.kmode == KMode::AuxImport) {
      json path = json::array();
      for (const Value *k : {&inst.import.k0, &inst.import.k1, &inst.import.k2})
        if (path.size() < inst.import.count)
          path.push_back(value_json(*k));
      j["import"] = path;
    }
    if (p.lineInfoEnabled)
      j["line"] = p.lineAt(pc);
    return j;
  }

  json dumpModuleJson(const Module &module) {
    json out;
    out["version"]      = module.version;
    out["typesVersion"] = module.typesVersion;
    out["main"]         = module.mainIndex;
    out["strings"]      = module.strings;
    out["protos"]       = json::array();
    for (const auto &p : module.protos) {
      json jp;
      jp["index"]        = p.index;
      jp["name"]         = p.debugName;
      jp["lineDefined"]  = p.lineDefined;
      jp["maxStackSize"] = p.maxStackSize;
      jp["numParams"]    = p.numParams;
      jp["numUpvalues"]  = p.numUpvalues;
      jp["isVararg"]     = p.isVararg;
      jp["children"]     = p.children;
      jp["constants"]    = json::array();
      for (const auto &k : p.constants)
        jp["constants"].push_back(constant_json(k));
      jp["code"] = json::array();
      for (uint32_t pc = 0; pc < p.code.size(); ++pc)
        jp["code"].push_back(instruction_json(p, pc));
      out["protos"].push_back(std::move(jp));
    }
    return out;
  }

} // namespace bcvm
