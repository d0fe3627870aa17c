#include <gtest/gtest.h>
#include "../../Application/bcvm-vm/iteration.hpp"
#include "../../Infrastructure/bcvm-stdlib/baselib.hpp"
#include "fixtures.hpp"

using namespace bcvm;
using fixtures::newTable;
using fixtures::run;

static TableRef list_of(std::initializer_list<int> items){
  auto t = newTable();
  long long i = 1;
  for (int v : items)
    t->setInt(i++, Value(v));
  return t;
}

// sum = 0; for k, v in <R1..R3 set up by `prologue`> do sum += v end; return sum
template <typename Prologue>
static void sum_values(ProtoBuilder &p, Prologue prologue){
  p.maxStack(6);
  p.ad(OP_LOADN, 0, 0);
  prologue(p);
  uint32_t prep = p.ad(OP_FORGPREP, 1, 0);
  uint32_t body = p.abc(OP_ADD, 0, 0, 5);
  uint32_t loop = p.adAux(OP_FORGLOOP, 1, 0, 2);
  p.patchD(prep, loop);
  p.patchD(loop, body);
  p.abc(OP_RETURN, 0, 2);
}

TEST(Iteration, GeneralizedLoopOverTable){
  ModuleBuilder mb;
  auto &p = mb.proto();
  sum_values(p, [](ProtoBuilder &b){
    b.abcAux(OP_GETGLOBAL, 1, 0, 0, b.constString("t"));
    b.abc(OP_LOADNIL, 2);
    b.abc(OP_LOADNIL, 3);
  });

  auto env = newTable();
  env->setField("t", list_of({10, 20, 30}));
  EXPECT_EQ(run(mb, env)[0], Value(60));
}

TEST(Iteration, GeneralizedLoopOverEmptyTableSkipsBody){
  ModuleBuilder mb;
  auto &p = mb.proto();
  sum_values(p, [](ProtoBuilder &b){
    b.abcAux(OP_GETGLOBAL, 1, 0, 0, b.constString("t"));
    b.abc(OP_LOADNIL, 2);
    b.abc(OP_LOADNIL, 3);
  });

  auto env = newTable();
  env->setField("t", newTable());
  EXPECT_EQ(run(mb, env)[0], Value(0));
}

TEST(Iteration, PairsCallsNextThroughTheIteratorProtocol){
  ModuleBuilder mb;
  auto &p = mb.proto();
  sum_values(p, [](ProtoBuilder &b){
    b.abcAux(OP_GETGLOBAL, 1, 0, 0, b.constString("pairs"));
    b.abcAux(OP_GETGLOBAL, 2, 0, 0, b.constString("t"));
    b.abc(OP_CALL, 1, 2, 4);
  });

  auto env = newTable();
  openBaseLibrary(env);
  auto t = list_of({10, 20, 30});
  t->setField("x", Value(5));
  env->setField("t", t);
  EXPECT_EQ(run(mb, env)[0], Value(65));
}

TEST(Iteration, IpairsStopsAtFirstHole){
  ModuleBuilder mb;
  auto &p = mb.proto();
  sum_values(p, [](ProtoBuilder &b){
    b.abcAux(OP_GETGLOBAL, 1, 0, 0, b.constString("ipairs"));
    b.abcAux(OP_GETGLOBAL, 2, 0, 0, b.constString("t"));
    b.abc(OP_CALL, 1, 2, 4);
  });

  auto env = newTable();
  openBaseLibrary(env);
  auto t = list_of({1, 2});
  t->setInt(4, Value(4));
  env->setField("t", t);
  EXPECT_EQ(run(mb, env)[0], Value(3));
}

TEST(Iteration, TableIsNotCallableWithoutGeneralizedIteration){
  ModuleBuilder mb;
  auto &p = mb.proto();
  sum_values(p, [](ProtoBuilder &b){
    b.abcAux(OP_GETGLOBAL, 1, 0, 0, b.constString("t"));
    b.abc(OP_LOADNIL, 2);
    b.abc(OP_LOADNIL, 3);
  });

  auto env = newTable();
  env->setField("t", list_of({1}));
  Settings s;
  s.generalizedIteration = false;
  EXPECT_NE(fixtures::faultMessage(mb, env, s).find("attempt to call a table value"), std::string::npos);
}

TEST(Iteration, NumberHasNoIterationProtocol){
  ModuleBuilder mb;
  auto &p = mb.proto();
  sum_values(p, [](ProtoBuilder &b){
    b.ad(OP_LOADN, 1, 3);
    b.abc(OP_LOADNIL, 2);
    b.abc(OP_LOADNIL, 3);
  });
  EXPECT_NE(fixtures::faultMessage(mb).find("attempt to iterate over a number value"), std::string::npos);
}

TEST(Iteration, LoopCanRunAgainAfterCompleting){
  ModuleBuilder mb;
  auto &p = mb.proto();
  sum_values(p, [](ProtoBuilder &b){
    b.abcAux(OP_GETGLOBAL, 1, 0, 0, b.constString("t"));
    b.abc(OP_LOADNIL, 2);
    b.abc(OP_LOADNIL, 3);
  });

  auto env = newTable();
  env->setField("t", list_of({1, 2}));
  auto entry = load(mb.serialize(), env);
  EXPECT_EQ(entry.main->call({})[0], Value(3));
  EXPECT_EQ(entry.main->call({})[0], Value(3));
}

TEST(IterationBridge, SentinelIsSticky){
  auto bridge = makeIterationBridge(Value(list_of({7, 8})), 2);
  auto first  = bridge.step();
  ASSERT_TRUE(first);
  EXPECT_EQ((*first)[0], Value(1));
  EXPECT_EQ((*first)[1], Value(7));
  ASSERT_TRUE(bridge.step());
  EXPECT_FALSE(bridge.step());
  EXPECT_TRUE(bridge.finished());

  uint64_t resumes = bridge.resumes();
  EXPECT_FALSE(bridge.step());
  EXPECT_FALSE(bridge.step());
  EXPECT_EQ(bridge.resumes(), resumes);
}

TEST(IterationBridge, PadsAndTruncatesToArity){
  auto wide = makeIterationBridge(Value(list_of({9})), 3);
  auto v    = wide.step();
  ASSERT_TRUE(v);
  ASSERT_EQ(v->size(), 3u);
  EXPECT_TRUE((*v)[2].isNil());

  auto narrow = makeIterationBridge(Value(list_of({9})), 1);
  auto k      = narrow.step();
  ASSERT_TRUE(k);
  ASSERT_EQ(k->size(), 1u);
  EXPECT_EQ((*k)[0], Value(1));
}

TEST(IterationBridge, RejectsValuesWithoutProtocol){
  EXPECT_THROW(makeIterationBridge(Value(5), 2), RuntimeFault);
  EXPECT_THROW(makeIterationBridge(Value("s"), 2), RuntimeFault);
}
