#include "settings_json.hpp"
#include <fmt/core.h>
#include <fstream>
#include <stdexcept>

namespace bcvm {

  using nlohmann::json;

  template <typename T>
  static void read_key(const json &j, const char *key, T &out) {
    try {
      out = j.at(key).get<T>();
    } catch (const json::exception &e) {
      throw std::invalid_argument(fmt::format("settings key '{}': {}", key, e.what()));
    }
  }

  Settings settingsFromJson(const json &j, Settings base) {
    if (!j.is_object())
      throw std::invalid_argument("settings document must be a JSON object");

    for (auto it = j.begin(); it != j.end(); ++it) {
      const std::string &key = it.key();
      if (key == "vectorSize") {
        read_key(j, "vectorSize", base.vectorSize);
        if (base.vectorSize != 3 && base.vectorSize != 4)
          throw std::invalid_argument(fmt::format("settings key 'vectorSize': expected 3 or 4, got {}", base.vectorSize));
      } else if (key == "maxRegisters") {
        read_key(j, "maxRegisters", base.maxRegisters);
      } else if (key == "maxCallDepth") {
        read_key(j, "maxCallDepth", base.maxCallDepth);
      } else if (key == "generalizedIteration") {
        read_key(j, "generalizedIteration", base.generalizedIteration);
      } else if (key == "errorHandling") {
        read_key(j, "errorHandling", base.errorHandling);
      } else if (key == "allowProxyErrors") {
        read_key(j, "allowProxyErrors", base.allowProxyErrors);
      } else if (key == "useNativeNamecall") {
        read_key(j, "useNativeNamecall", base.useNativeNamecall);
      } else if (key == "namecallReinvokesHooks") {
        read_key(j, "namecallReinvokesHooks", base.namecallReinvokesHooks);
      } else if (key == "useImportConstants") {
        read_key(j, "useImportConstants", base.useImportConstants);
      } else if (key == "trace") {
        read_key(j, "trace", base.trace);
      } else if (key == "traceLimit") {
        read_key(j, "traceLimit", base.traceLimit);
      } else {
        throw std::invalid_argument(fmt::format("unknown settings key '{}'", key));
      }
    }
    return base;
  }

  Settings settingsFromFile(const std::string &path, Settings base) {
    std::ifstream ifs(path);
    if (!ifs)
      throw std::invalid_argument(fmt::format("cannot open settings file: {}", path));
    json j;
    try {
      ifs >> j;
    } catch (const json::parse_error &e) {
      throw std::invalid_argument(fmt::format("settings file {}: {}", path, e.what()));
    }
    return settingsFromJson(j, std::move(base));
  }

  json settingsToJson(const Settings &s) {
    json j;
    j["vectorSize"]             = s.vectorSize;
    j["maxRegisters"]           = s.maxRegisters;
    j["maxCallDepth"]           = s.maxCallDepth;
    j["generalizedIteration"]   = s.generalizedIteration;
    j["errorHandling"]          = s.errorHandling;
    j["allowProxyErrors"]       = s.allowProxyErrors;
    j["useNativeNamecall"]      = s.useNativeNamecall;
    j["namecallReinvokesHooks"] = s.namecallReinvokesHooks;
    j["useImportConstants"]     = s.useImportConstants;
    j["trace"]                  = s.trace;
    j["traceLimit"]             = s.traceLimit;
    return j;
  }

} // namespace bcvm
