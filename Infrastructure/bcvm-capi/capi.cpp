#include "capi.hpp"
#include "../../Application/bcvm-loader/deserializer.hpp"
#include "../../Application/bcvm-vm/vm.hpp"
#include "../../Domain/bcvm-core/errors.hpp"
#include "../bcvm-config/module_json.hpp"
#include "../bcvm-config/settings_json.hpp"
#include "../bcvm-stdlib/baselib.hpp"
#include <cstdlib>
#include <cstring>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

static char* dup_utf8(const std::string& s){
  char* p = (char*)::malloc(s.size()+1);
  if (!p) return nullptr;
  std::memcpy(p, s.data(), s.size());
  p[s.size()] = '\0';
  return p;
}

static json result_json(const bcvm::ValueList& values){
  json out = json::array();
  for (const auto& v : values){
    if (v.isNil()) out.push_back(nullptr);
    else if (v.isBoolean()) out.push_back(v.asBoolean());
    else if (v.isNumber()) out.push_back(v.asNumber());
    else out.push_back(bcvm::toString(v));
  }
  return out;
}

extern "C" {

BCVM_API void bcvm_free(char* ptr){ if(ptr) ::free(ptr); }

BCVM_API int bcvm_check_bytecode(const uint8_t* bytes, size_t size, char** out_json, char** out_error){
  if (!bytes || !out_json || !out_error) return 1;
  *out_json = nullptr; *out_error = nullptr;
  try{
    auto mod = bcvm::deserialize(std::string_view((const char*)bytes, size));
    *out_json = dup_utf8(bcvm::dumpModuleJson(*mod).dump());
    if (!*out_json) { *out_error = dup_utf8("alloc failure"); return 2; }
    return 0;
  } catch (const bcvm::VmError& ex){
    *out_error = dup_utf8(ex.what());
    return 4;
  } catch (const std::exception& ex){
    *out_error = dup_utf8(ex.what());
    return 3;
  } catch (...) {
    *out_error = dup_utf8("unknown error");
    return 3;
  }
}

BCVM_API int bcvm_run_bytecode(const uint8_t* bytes, size_t size, const char* settings_json, char** out_json, char** out_error){
  if (!bytes || !out_json || !out_error) return 1;
  *out_json = nullptr; *out_error = nullptr;
  try{
    bcvm::Settings settings;
    if (settings_json) settings = bcvm::settingsFromJson(json::parse(settings_json));
    auto env = std::make_shared<bcvm::Table>();
    bcvm::openBaseLibrary(env);
    auto entry = bcvm::load(std::string_view((const char*)bytes, size), env, settings);
    auto values = entry.main->call({});
    entry.close();
    *out_json = dup_utf8(result_json(values).dump());
    if (!*out_json) { *out_error = dup_utf8("alloc failure"); return 2; }
    return 0;
  } catch (const bcvm::VmError& ex){
    *out_error = dup_utf8(ex.what());
    return 4;
  } catch (const std::exception& ex){
    *out_error = dup_utf8(ex.what());
    return 3;
  } catch (...) {
    *out_error = dup_utf8("unknown error");
    return 3;
  }
}

} // extern "C"
