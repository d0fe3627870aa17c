#include "../../../Application/bcvm-loader/coverage.hpp"
#include "../../../Application/bcvm-loader/deserializer.hpp"
#include "../../../Application/bcvm-vm/vm.hpp"
#include "../../../Domain/bcvm-core/errors.hpp"
#include "../../../Domain/bcvm-core/table.hpp"
#include "../../../Infrastructure/bcvm-config/module_json.hpp"
#include "../../../Infrastructure/bcvm-config/settings_json.hpp"
#include "../../../Infrastructure/bcvm-stdlib/baselib.hpp"
#include <cstdlib>
#include <fmt/core.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

static const char *kVersion = "bcvm 0.3.0";

static void print_usage() {
  fmt::print("Usage: bcvm [--run|--dump|--coverage] [--settings PATH] [--trace] [--trace-limit N] <file>\n"
             "       bcvm --version | --help\n");
}

static bool read_file(const std::string &path, std::string &out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    return false;
  std::stringstream ss;
  ss << ifs.rdbuf();
  out = ss.str();
  return true;
}

static std::string join_results(const bcvm::ValueList &values) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i)
      out += ", ";
    out += bcvm::toString(values[i]);
  }
  return out;
}

static int handle_run(const std::string &bytes, const bcvm::Settings &settings) {
  fmt::print(stderr, "[cli] enter --run\n");
  auto env = std::make_shared<bcvm::Table>();
  bcvm::openBaseLibrary(env);
  auto entry  = bcvm::load(bytes, env, settings);
  auto result = entry.main->call({});
  entry.close();
  fmt::print(stderr, "[cli] ran: {} value(s)\n", result.size());
  fmt::print("Result: {}\n", join_results(result));
  return 0;
}

static int handle_coverage(const std::string &bytes, bcvm::Settings settings) {
  fmt::print(stderr, "[cli] enter --coverage\n");
  auto module = bcvm::deserialize(bytes, settings);
  auto env    = std::make_shared<bcvm::Table>();
  bcvm::openBaseLibrary(env);
  auto entry = bcvm::load(module, env, std::move(settings));
  (void)entry.main->call({});
  entry.close();

  nlohmann::json out;
  out["maxLine"] = bcvm::maxCoverageLine(*module);
  out["protos"]  = nlohmann::json::array();
  for (const auto &c : bcvm::collectCoverage(*module)) {
    nlohmann::json jp;
    jp["name"]        = c.name;
    jp["lineDefined"] = c.lineDefined;
    jp["depth"]       = c.depth;
    jp["hits"]        = nlohmann::json::object();
    for (const auto &[line, hits] : c.hits)
      jp["hits"][std::to_string(line)] = hits;
    out["protos"].push_back(std::move(jp));
  }
  fmt::print("{}\n", out.dump(2));
  return 0;
}

int main(int argc, char **argv) {
  std::string mode;
  if (argc >= 2)
    mode = argv[1];
  if (mode == "--help" || argc < 2) {
    print_usage();
    return 0;
  }
  if (mode == "--version") {
    fmt::print("{}\n", kVersion);
    return 0;
  }
  if (!(mode == "--run" || mode == "--dump" || mode == "--coverage")) {
    print_usage();
    return 2;
  }

  std::string settingsPath;
  bool traceExec      = false;
  uint64_t traceLimit = 0;
  std::vector<std::string> positional;
  for (int i = 2; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--settings" && i + 1 < argc) { settingsPath = argv[++i]; continue; }
    if (a.rfind("--settings=", 0) == 0) { settingsPath = a.substr(11); continue; }
    if (a == "--trace") { traceExec = true; continue; }
    if (a == "--trace-limit" && i + 1 < argc) { traceLimit = (uint64_t)std::strtoull(argv[++i], nullptr, 10); continue; }
    if (!a.empty() && a[0] != '-') positional.push_back(a);
  }
  if (positional.empty()) {
    print_usage();
    return 2;
  }
  std::string fileArg = positional.back();
  fmt::print(stderr, "[cli] input: {}\n", fileArg);

  std::string bytes;
  if (!read_file(fileArg, bytes)) {
    fmt::print("cannot open file: {}\n", fileArg);
    return 1;
  }

  try {
    bcvm::Settings settings;
    if (!settingsPath.empty()) {
      fmt::print(stderr, "[cli] settings: {}\n", settingsPath);
      settings = bcvm::settingsFromFile(settingsPath);
    }
    if (traceExec)
      settings.trace = true;
    if (traceLimit)
      settings.traceLimit = traceLimit;

    if (mode == "--dump") {
      auto module = bcvm::deserialize(bytes, settings);
      fmt::print("{}\n", bcvm::dumpModuleJson(*module).dump(2));
      return 0;
    }
    if (mode == "--coverage")
      return handle_coverage(bytes, std::move(settings));
    return handle_run(bytes, settings);
  } catch (const bcvm::CorruptBytecode &e) {
    fmt::print("Load error: {}\n", e.what());
    return 1;
  } catch (const bcvm::UnsupportedOpcode &e) {
    fmt::print("Load error: {}\n", e.what());
    return 1;
  } catch (const std::exception &e) {
    fmt::print("Runtime error: {}\n", e.what());
    return 1;
  }
}
