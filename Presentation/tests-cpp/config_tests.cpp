#include <gtest/gtest.h>
#include "../../Application/bcvm-assembler/emitter.hpp"
#include "../../Application/bcvm-loader/deserializer.hpp"
#include "../../Infrastructure/bcvm-config/module_json.hpp"
#include "../../Infrastructure/bcvm-capi/capi.hpp"
#include "../../Infrastructure/bcvm-config/settings_json.hpp"
#include <filesystem>
#include <fstream>

using namespace bcvm;
using nlohmann::json;

TEST(SettingsJson, OverridesOnlyPresentKeys){
  Settings base;
  base.maxCallDepth = 50;
  auto s = settingsFromJson(json{{"vectorSize", 4}, {"generalizedIteration", false}, {"traceLimit", 12}}, base);
  EXPECT_EQ(s.vectorSize, 4);
  EXPECT_FALSE(s.generalizedIteration);
  EXPECT_EQ(s.traceLimit, 12u);
  EXPECT_EQ(s.maxCallDepth, 50u);
  EXPECT_TRUE(s.errorHandling);
}

TEST(SettingsJson, RejectsBadDocuments){
  EXPECT_THROW(settingsFromJson(json{{"colour", 1}}), std::invalid_argument);
  EXPECT_THROW(settingsFromJson(json{{"trace", "yes"}}), std::invalid_argument);
  EXPECT_THROW(settingsFromJson(json{{"vectorSize", 5}}), std::invalid_argument);
  EXPECT_THROW(settingsFromJson(json::array({1, 2})), std::invalid_argument);
}

TEST(SettingsJson, RoundTripsScalars){
  Settings s;
  s.allowProxyErrors       = true;
  s.namecallReinvokesHooks = false;
  s.maxRegisters           = 512;
  auto back                = settingsFromJson(settingsToJson(s));
  EXPECT_TRUE(back.allowProxyErrors);
  EXPECT_FALSE(back.namecallReinvokesHooks);
  EXPECT_EQ(back.maxRegisters, 512u);
}

TEST(SettingsJson, ReadsFile){
  auto path = std::filesystem::temp_directory_path() / "bcvm_settings_test.json";
  {
    std::ofstream ofs(path);
    ofs << R"({"useImportConstants": true, "maxCallDepth": 9})";
  }
  auto s = settingsFromFile(path.string());
  EXPECT_TRUE(s.useImportConstants);
  EXPECT_EQ(s.maxCallDepth, 9u);
  std::filesystem::remove(path);

  EXPECT_THROW(settingsFromFile((std::filesystem::temp_directory_path() / "bcvm_missing.json").string()),
               std::invalid_argument);
}

TEST(ModuleJson, DescribesPrototypesAndCode){
  ModuleBuilder mb;
  auto &main   = mb.proto();
  auto &helper = mb.proto();
  helper.name("helper").lineDefined(3).params(1).maxStack(1);
  helper.abc(OP_RETURN, 0, 2);

  main.maxStack(2).line(1);
  main.ad(OP_LOADK, 0, (int16_t)main.constString("hi"));
  main.abcAux(OP_GETGLOBAL, 1, 0, 0, main.constString("x"));
  main.ad(OP_NEWCLOSURE, 1, (int16_t)main.child(helper.index()));
  main.line(2);
  main.abc(OP_RETURN, 0, 2);

  auto module = deserialize(mb.serialize());
  json j      = dumpModuleJson(*module);
  EXPECT_EQ(j["version"], 5);
  EXPECT_EQ(j["main"], 0);
  EXPECT_EQ(j["strings"], json::array({"helper", "hi", "x"}));
  ASSERT_EQ(j["protos"].size(), 2u);

  const json &p0 = j["protos"][0];
  EXPECT_EQ(p0["name"], "(main)");
  EXPECT_EQ(p0["children"], json::array({1}));
  EXPECT_EQ(p0["constants"][0]["kind"], "string");
  EXPECT_EQ(p0["constants"][0]["value"], "hi");

  const json &code = p0["code"];
  ASSERT_EQ(code.size(), 5u);
  EXPECT_EQ(code[0]["op"], "LOADK");
  EXPECT_EQ(code[0]["K"], "hi");
  EXPECT_EQ(code[0]["line"], 1);
  EXPECT_EQ(code[1]["op"], "GETGLOBAL");
  EXPECT_EQ(code[1]["K"], "x");
  EXPECT_FALSE(code[2].contains("op"));
  EXPECT_EQ(code[4]["line"], 2);

  const json &p1 = j["protos"][1];
  EXPECT_EQ(p1["name"], "helper");
  EXPECT_EQ(p1["numParams"], 1);
  EXPECT_EQ(p1["lineDefined"], 3);
  EXPECT_FALSE(p1["code"][0].contains("line"));
}

static std::string answer_module(){
  ModuleBuilder mb;
  auto &p = mb.proto();
  p.maxStack(2);
  p.ad(OP_LOADN, 0, 42);
  p.ad(OP_LOADK, 1, (int16_t)p.constString("ok"));
  p.abc(OP_RETURN, 0, 3);
  return mb.serialize();
}

TEST(CApi, RunReturnsResultsAsJson){
  auto bytes      = answer_module();
  char *out_json  = nullptr;
  char *out_error = nullptr;
  int rc = bcvm_run_bytecode((const uint8_t *)bytes.data(), bytes.size(), R"({"maxCallDepth": 10})", &out_json, &out_error);
  ASSERT_EQ(rc, 0);
  ASSERT_NE(out_json, nullptr);
  EXPECT_EQ(out_error, nullptr);
  EXPECT_EQ(json::parse(out_json), json::array({42, "ok"}));
  bcvm_free(out_json);
}

TEST(CApi, CheckReturnsModuleDump){
  auto bytes      = answer_module();
  char *out_json  = nullptr;
  char *out_error = nullptr;
  ASSERT_EQ(bcvm_check_bytecode((const uint8_t *)bytes.data(), bytes.size(), &out_json, &out_error), 0);
  json dump = json::parse(out_json);
  EXPECT_EQ(dump["protos"][0]["code"][0]["op"], "LOADN");
  bcvm_free(out_json);
}

TEST(CApi, ReportsErrorCodes){
  const uint8_t bad[] = {0};
  char *out_json  = nullptr;
  char *out_error = nullptr;
  EXPECT_EQ(bcvm_run_bytecode(bad, sizeof bad, nullptr, &out_json, &out_error), 4);
  EXPECT_EQ(out_json, nullptr);
  ASSERT_NE(out_error, nullptr);
  EXPECT_NE(std::string(out_error).find("version"), std::string::npos);
  bcvm_free(out_error);

  out_error = nullptr;
  EXPECT_EQ(bcvm_check_bytecode(bad, sizeof bad, &out_json, &out_error), 4);
  bcvm_free(out_error);

  auto bytes = answer_module();
  out_error  = nullptr;
  EXPECT_EQ(bcvm_run_bytecode((const uint8_t *)bytes.data(), bytes.size(), R"({"colour": 1})", &out_json, &out_error), 3);
  bcvm_free(out_error);

  EXPECT_EQ(bcvm_run_bytecode(nullptr, 0, nullptr, &out_json, &out_error), 1);
}
