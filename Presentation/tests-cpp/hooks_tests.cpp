#include <gtest/gtest.h>
#include "../../Application/bcvm-loader/coverage.hpp"
#include "../../Infrastructure/bcvm-stdlib/baselib.hpp"
#include "fixtures.hpp"
#include <cctype>

using namespace bcvm;
using fixtures::newTable;
using fixtures::run;

// sumLoop with a COVERAGE probe on line 5 inside the loop body
static ModuleBuilder covered_loop(int16_t n){
  ModuleBuilder mb;
  auto &p = mb.proto();
  p.maxStack(4).line(1);
  p.ad(OP_LOADN, 0, 0);
  p.ad(OP_LOADN, 1, n);
  p.ad(OP_LOADN, 2, 1);
  p.ad(OP_LOADN, 3, 1);
  p.line(2);
  uint32_t prep = p.ad(OP_FORNPREP, 1, 0);
  p.line(5);
  uint32_t body = p.e(OP_COVERAGE, 0);
  p.abc(OP_ADD, 0, 0, 3);
  p.line(6);
  uint32_t loop = p.ad(OP_FORNLOOP, 1, 0);
  p.patchD(loop, body);
  p.line(7);
  uint32_t exit = p.abc(OP_RETURN, 0, 2);
  p.patchD(prep, exit);
  return mb;
}

TEST(Coverage, CountsProbeHitsPerLine){
  auto entry = load(covered_loop(2).serialize(), newTable());
  EXPECT_EQ(entry.main->call({})[0], Value(3));

  auto report = collectCoverage(entry.vm->module());
  ASSERT_EQ(report.size(), 1u);
  EXPECT_EQ(report[0].name, "(main)");
  EXPECT_EQ(report[0].depth, 0u);
  ASSERT_EQ(report[0].hits.size(), 1u);
  EXPECT_EQ(report[0].hits.at(5), 2u);
  EXPECT_EQ(maxCoverageLine(entry.vm->module()), 7);

  entry.vm->module().resetCoverage();
  EXPECT_EQ(collectCoverage(entry.vm->module())[0].hits.at(5), 0u);
}

TEST(Coverage, WalksChildrenDepthFirst){
  ModuleBuilder mb;
  auto &main  = mb.proto();
  auto &child = mb.proto();
  child.name("helper").lineDefined(10).maxStack(1).line(11);
  child.e(OP_COVERAGE, 0);
  child.abc(OP_RETURN, 0, 1);
  main.maxStack(1).line(1);
  main.ad(OP_NEWCLOSURE, 0, (int16_t)main.child(child.index()));
  main.abc(OP_RETURN, 0, 1);

  auto module = deserialize(mb.serialize());
  auto report = collectCoverage(*module);
  ASSERT_EQ(report.size(), 2u);
  EXPECT_EQ(report[1].name, "helper");
  EXPECT_EQ(report[1].depth, 1u);
  EXPECT_EQ(report[1].lineDefined, 10u);
  EXPECT_EQ(report[1].hits.at(11), 0u);
  EXPECT_EQ(maxCoverageLine(*module), 11);
  EXPECT_EQ(collectCoverage(*module, 1u).size(), 1u);
}

TEST(Coverage, RequiresLineInfo){
  ModuleBuilder mb;
  fixtures::sumLoop(mb.proto(), 1);
  auto module = deserialize(mb.serialize());
  EXPECT_THROW(collectCoverage(*module), std::invalid_argument);
  EXPECT_THROW(maxCoverageLine(*module), std::invalid_argument);
  EXPECT_THROW(collectCoverage(*module, 4u), std::invalid_argument);
}

TEST(Hooks, StepSeesEveryExecutedSlot){
  ModuleBuilder mb;
  fixtures::sumLoop(mb.proto(), 2);
  std::vector<uint32_t> pcs;
  Settings s;
  s.hooks.step = [&](const HookContext &ctx) { pcs.push_back(ctx.pc); };
  EXPECT_EQ(run(mb, newTable(), s)[0], Value(3));
  EXPECT_EQ(pcs, (std::vector<uint32_t>{0, 1, 2, 3, 4, 5, 6, 5, 6, 7}));
}

TEST(Hooks, InterruptFiresOnLoopBackEdgesAndReturn){
  ModuleBuilder mb;
  fixtures::sumLoop(mb.proto(), 5);
  int interrupts = 0;
  std::vector<std::string> ops;
  Settings s;
  s.hooks.interrupt = [&](const HookContext &ctx) {
    ++interrupts;
    ops.push_back(ctx.opname);
  };
  EXPECT_EQ(run(mb, newTable(), s)[0], Value(15));
  EXPECT_EQ(interrupts, 6);
  EXPECT_EQ(ops.front(), "FORNLOOP");
  EXPECT_EQ(ops.back(), "RETURN");
}

TEST(Hooks, BreakpointCanReturnEarly){
  ModuleBuilder mb;
  fixtures::sumLoop(mb.proto(), 5);
  int hits = 0;
  Settings s;
  s.hooks.breakpoint = [&](const HookContext &ctx) -> std::optional<ValueList> {
    ++hits;
    EXPECT_EQ(ctx.pc, 7u);
    return ValueList{Value(99)};
  };
  auto entry = load(mb.serialize(), newTable(), s);
  entry.vm->module().setBreakpoint(0, 7, true);
  EXPECT_EQ(entry.main->call({})[0], Value(99));
  EXPECT_EQ(hits, 1);

  entry.vm->module().setBreakpoint(0, 7, false);
  EXPECT_EQ(entry.main->call({})[0], Value(15));
  EXPECT_EQ(hits, 1);
}

TEST(Hooks, DeclinedBreakpointRunsOriginalInstruction){
  ModuleBuilder mb;
  fixtures::sumLoop(mb.proto(), 5);
  int hits = 0;
  Settings s;
  s.hooks.breakpoint = [&](const HookContext &) -> std::optional<ValueList> {
    ++hits;
    return std::nullopt;
  };
  auto entry = load(mb.serialize(), newTable(), s);
  entry.vm->module().setBreakpoint(0, 5, true);
  EXPECT_EQ(entry.main->call({})[0], Value(15));
  EXPECT_EQ(hits, 5);
}

TEST(Hooks, BreakpointOnAuxSlotIsRejected){
  ModuleBuilder mb;
  auto &p = mb.proto();
  p.maxStack(1);
  p.abcAux(OP_GETGLOBAL, 0, 0, 0, p.constString("x"));
  p.abc(OP_RETURN, 0, 2);
  auto module = deserialize(mb.serialize());
  EXPECT_THROW(module->setBreakpoint(0, 1, true), std::out_of_range);
  EXPECT_THROW(module->setBreakpoint(3, 0, true), std::out_of_range);
}

static ModuleBuilder namecall_module(){
  ModuleBuilder mb;
  auto &p = mb.proto();
  p.maxStack(2);
  p.ad(OP_LOADK, 1, (int16_t)p.constString("abc"));
  p.abcAux(OP_NAMECALL, 0, 1, 0, p.constString("upper"));
  p.abc(OP_CALL, 0, 2, 2);
  p.abc(OP_RETURN, 0, 2);
  return mb;
}

struct NamecallCounts {
  int steps{0};
  int interrupts{0};
};

static NamecallCounts count_namecall(bool reinvoke, bool accept){
  NamecallCounts counts;
  Settings s;
  s.stringMethods = newTable();
  s.stringMethods->setField("upper", makeNative("upper", [](const ValueList &args) {
                              std::string out = args.at(0).asString();
                              for (auto &c : out)
                                c = (char)std::toupper((unsigned char)c);
                              return ValueList{out};
                            }));
  s.useNativeNamecall      = true;
  s.namecallReinvokesHooks = reinvoke;
  s.namecallHandler        = [accept](const std::string &, const ValueList &) -> std::optional<ValueList> {
    if (!accept)
      return std::nullopt;
    return ValueList{Value("native")};
  };
  s.hooks.step      = [&](const HookContext &) { ++counts.steps; };
  s.hooks.interrupt = [&](const HookContext &) { ++counts.interrupts; };
  auto out          = run(namecall_module(), newTable(), s);
  EXPECT_EQ(out[0], accept ? Value("native") : Value("ABC"));
  return counts;
}

TEST(Hooks, NamecallHookCountsWhenReinvoking){
  auto accepted = count_namecall(true, true);
  EXPECT_EQ(accepted.steps, 4);
  EXPECT_EQ(accepted.interrupts, 2);
  auto declined = count_namecall(true, false);
  EXPECT_EQ(declined.steps, 5);
  EXPECT_EQ(declined.interrupts, 3);
}

TEST(Hooks, NamecallHookCountsWithoutReinvoking){
  auto accepted = count_namecall(false, true);
  EXPECT_EQ(accepted.steps, 4);
  EXPECT_EQ(accepted.interrupts, 2);
  auto declined = count_namecall(false, false);
  EXPECT_EQ(declined.steps, 4);
  EXPECT_EQ(declined.interrupts, 2);
}

TEST(Hooks, TraceHonoursLimit){
  ModuleBuilder mb;
  fixtures::sumLoop(mb.proto(), 5);
  Settings s;
  s.trace      = true;
  s.traceLimit = 3;
  testing::internal::CaptureStderr();
  run(mb, newTable(), s);
  std::string err = testing::internal::GetCapturedStderr();

  std::size_t lines = 0;
  for (std::size_t at = err.find("[trace]"); at != std::string::npos; at = err.find("[trace]", at + 1))
    ++lines;
  EXPECT_EQ(lines, 3u);
  EXPECT_NE(err.find("[trace] (main)#0 LOADN"), std::string::npos);
}

// main calls a child named "boom" that adds two nils
static ModuleBuilder faulting_child(){
  ModuleBuilder mb;
  auto &main  = mb.proto();
  auto &child = mb.proto();
  child.name("boom").maxStack(3);
  child.abc(OP_LOADNIL, 1);
  child.abc(OP_ADD, 0, 1, 2);
  child.abc(OP_RETURN, 0, 2);

  main.maxStack(1);
  main.ad(OP_NEWCLOSURE, 0, (int16_t)main.child(child.index()));
  main.abc(OP_CALL, 0, 1, 1);
  main.abc(OP_RETURN, 0, 1);
  return mb;
}

TEST(Panic, ReportedOnceAtTheFaultingFrame){
  std::vector<std::string> panics;
  Settings s;
  s.hooks.panic = [&](const std::string &message, const Value &error, const HookContext &ctx) {
    panics.push_back(message);
    EXPECT_EQ(error, Value(message));
    EXPECT_EQ(ctx.proto.debugName, "boom");
    EXPECT_STREQ(ctx.opname, "ADD");
  };
  auto entry  = load(faulting_child().serialize(), newTable(), s);
  auto result = protectedCall(Value(entry.main), {});
  EXPECT_FALSE(result.ok);
  ASSERT_EQ(panics.size(), 1u);
  EXPECT_EQ(panics[0], "boom:pc 1 (ADD): attempt to perform arithmetic (add) on nil and nil");
  EXPECT_EQ(result.message, panics[0]);
  EXPECT_TRUE(result.error.isString());
}

TEST(Panic, RawModePropagatesUnlocatedFault){
  int panics = 0;
  Settings s;
  s.errorHandling = false;
  s.hooks.panic   = [&](const std::string &, const Value &, const HookContext &) { ++panics; };
  try {
    run(faulting_child(), newTable(), s);
    FAIL() << "expected a fault";
  } catch (const RuntimeFault &e) {
    EXPECT_STREQ(e.what(), "attempt to perform arithmetic (add) on nil and nil");
  }
  EXPECT_EQ(panics, 0);
}

// error(<table>) from main
static ModuleBuilder table_error(){
  ModuleBuilder mb;
  auto &p = mb.proto();
  p.maxStack(2);
  p.abcAux(OP_GETGLOBAL, 0, 0, 0, p.constString("error"));
  p.abcAux(OP_NEWTABLE, 1, 0, 0, 0);
  p.abc(OP_CALL, 0, 2, 1);
  p.abc(OP_RETURN, 0, 1);
  return mb;
}

TEST(Panic, ProxyErrorsKeepNonStringPayload){
  auto env = newTable();
  openBaseLibrary(env);
  std::string seen;
  Value seenError;
  Settings s;
  s.allowProxyErrors = true;
  s.hooks.panic      = [&](const std::string &message, const Value &error, const HookContext &) {
    seen      = message;
    seenError = error;
  };
  try {
    run(table_error(), env, s);
    FAIL() << "expected a script error";
  } catch (const ScriptError &e) {
    EXPECT_TRUE(e.payload().isTable());
    EXPECT_TRUE(e.reported());
    EXPECT_EQ(seenError, e.payload());
  }
  EXPECT_EQ(seen, "table");
  EXPECT_TRUE(seenError.isTable());
}

TEST(Panic, NonStringPayloadIsLocatedWithoutProxyErrors){
  auto env = newTable();
  openBaseLibrary(env);
  std::string message = fixtures::faultMessage(table_error(), env);
  EXPECT_EQ(message, "(main):pc 4 (CALL): table");
}

TEST(Panic, ScriptPcallCatchesError){
  ModuleBuilder mb;
  auto &p = mb.proto();
  p.maxStack(3);
  p.abcAux(OP_GETGLOBAL, 0, 0, 0, p.constString("pcall"));
  p.abcAux(OP_GETGLOBAL, 1, 0, 0, p.constString("error"));
  p.ad(OP_LOADK, 2, (int16_t)p.constString("oops"));
  p.abc(OP_CALL, 0, 3, 3);
  p.abc(OP_RETURN, 0, 3);

  auto env = newTable();
  openBaseLibrary(env);
  int panics = 0;
  Settings s;
  s.hooks.panic = [&](const std::string &, const Value &, const HookContext &) { ++panics; };
  auto out      = run(mb, env, s);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0], Value(false));
  EXPECT_EQ(out[1], Value("oops"));
  EXPECT_EQ(panics, 0);
}

TEST(Panic, ScriptPcallSeesLocatedChildFault){
  ModuleBuilder mb;
  auto &main  = mb.proto();
  auto &child = mb.proto();
  child.name("boom").maxStack(3);
  child.abc(OP_LOADNIL, 1);
  child.abc(OP_ADD, 0, 1, 2);
  child.abc(OP_RETURN, 0, 2);

  main.maxStack(2);
  main.abcAux(OP_GETGLOBAL, 0, 0, 0, main.constString("pcall"));
  main.ad(OP_NEWCLOSURE, 1, (int16_t)main.child(child.index()));
  main.abc(OP_CALL, 0, 2, 3);
  main.abc(OP_RETURN, 0, 3);

  auto env = newTable();
  openBaseLibrary(env);
  auto out = run(mb, env);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0], Value(false));
  EXPECT_EQ(out[1], Value("boom:pc 1 (ADD): attempt to perform arithmetic (add) on nil and nil"));
}
