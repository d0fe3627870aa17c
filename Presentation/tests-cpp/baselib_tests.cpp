#include <gtest/gtest.h>
#include "../../Infrastructure/bcvm-stdlib/baselib.hpp"
#include "fixtures.hpp"
#include <stdexcept>

using namespace bcvm;
using fixtures::newTable;

static ValueList call(const TableRef &env, const std::string &name, const ValueList &args){
  Value fn = env->getField(name);
  if (!fn.isFunction())
    throw std::runtime_error(name + " is not installed");
  return fn.asFunction()->call(args);
}

class BaseLib : public ::testing::Test {
protected:
  void SetUp() override {
    env = newTable();
    openBaseLibrary(env);
  }
  TableRef env;
};

TEST_F(BaseLib, TypeNames){
  EXPECT_EQ(call(env, "type", {Value()})[0], Value("nil"));
  EXPECT_EQ(call(env, "type", {Value(1)})[0], Value("number"));
  EXPECT_EQ(call(env, "type", {Value("s")})[0], Value("string"));
  EXPECT_EQ(call(env, "type", {Value(newTable())})[0], Value("table"));
  EXPECT_EQ(call(env, "type", {env->getField("print")})[0], Value("function"));
  EXPECT_THROW(call(env, "type", {}), RuntimeFault);
}

TEST_F(BaseLib, ToStringAndToNumber){
  EXPECT_EQ(call(env, "tostring", {Value(3)})[0], Value("3"));
  EXPECT_EQ(call(env, "tostring", {Value(true)})[0], Value("true"));
  EXPECT_EQ(call(env, "tonumber", {Value(" 42 ")})[0], Value(42));
  EXPECT_EQ(call(env, "tonumber", {Value("ff"), Value(16)})[0], Value(255));
  EXPECT_EQ(call(env, "tonumber", {Value("-101"), Value(2)})[0], Value(-5));
  EXPECT_TRUE(call(env, "tonumber", {Value("z"), Value(10)})[0].isNil());
  EXPECT_TRUE(call(env, "tonumber", {Value("abc")})[0].isNil());
  EXPECT_THROW(call(env, "tonumber", {Value("1"), Value(1)}), RuntimeFault);
}

TEST_F(BaseLib, SelectCountsAndSlices){
  EXPECT_EQ(call(env, "select", {Value("#"), Value(1), Value(2), Value(3)})[0], Value(3));
  auto tail = call(env, "select", {Value(2), Value("a"), Value("b"), Value("c")});
  ASSERT_EQ(tail.size(), 2u);
  EXPECT_EQ(tail[0], Value("b"));
  auto last = call(env, "select", {Value(-1), Value("a"), Value("b")});
  ASSERT_EQ(last.size(), 1u);
  EXPECT_EQ(last[0], Value("b"));
  EXPECT_TRUE(call(env, "select", {Value(5), Value("a")}).empty());
  EXPECT_THROW(call(env, "select", {Value(-3), Value("a")}), RuntimeFault);
}

TEST_F(BaseLib, RawEqualAndRawLen){
  auto t = newTable();
  t->setInt(1, Value("x"));
  t->setInt(2, Value("y"));
  EXPECT_EQ(call(env, "rawequal", {Value(t), Value(t)})[0], Value(true));
  EXPECT_EQ(call(env, "rawequal", {Value(t), Value(newTable())})[0], Value(false));
  EXPECT_EQ(call(env, "rawlen", {Value(t)})[0], Value(2));
  EXPECT_EQ(call(env, "rawlen", {Value("four")})[0], Value(4));
  EXPECT_THROW(call(env, "rawlen", {Value(4)}), RuntimeFault);
}

TEST_F(BaseLib, AssertPassesArgumentsThrough){
  auto out = call(env, "assert", {Value(1), Value("msg")});
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0], Value(1));
  try {
    call(env, "assert", {Value(false)});
    FAIL() << "expected assertion failure";
  } catch (const ScriptError &e) {
    EXPECT_STREQ(e.what(), "assertion failed!");
  }
  try {
    call(env, "assert", {Value(), Value("custom")});
    FAIL() << "expected assertion failure";
  } catch (const ScriptError &e) {
    EXPECT_EQ(e.payload(), Value("custom"));
  }
}

TEST_F(BaseLib, NextWalksEveryEntry){
  auto t = newTable();
  t->setInt(1, Value(10));
  t->setField("k", Value(20));
  double sum = 0;
  Value key;
  for (;;) {
    auto out = call(env, "next", {Value(t), key});
    if (out[0].isNil())
      break;
    key = out[0];
    sum += out[1].asNumber();
  }
  EXPECT_EQ(sum, 30);
  EXPECT_THROW(call(env, "next", {Value(1)}), RuntimeFault);
}

TEST_F(BaseLib, PairsAndIpairsReturnIteratorTriples){
  auto t     = newTable();
  auto pairs = call(env, "pairs", {Value(t)});
  ASSERT_EQ(pairs.size(), 3u);
  EXPECT_EQ(pairs[0], env->getField("next"));
  EXPECT_EQ(pairs[1], Value(t));
  EXPECT_TRUE(pairs[2].isNil());

  t->setInt(1, Value("a"));
  auto ipairs = call(env, "ipairs", {Value(t)});
  ASSERT_EQ(ipairs.size(), 3u);
  EXPECT_EQ(ipairs[2], Value(0));
  auto step = ipairs[0].asFunction()->call({ipairs[1], ipairs[2]});
  EXPECT_EQ(step[0], Value(1));
  EXPECT_EQ(step[1], Value("a"));
  EXPECT_TRUE(ipairs[0].asFunction()->call({ipairs[1], Value(1)})[0].isNil());
  EXPECT_THROW(call(env, "pairs", {Value("s")}), RuntimeFault);
}

TEST_F(BaseLib, PcallReportsSuccessAndFailure){
  auto ok = call(env, "pcall", {env->getField("tostring"), Value(7)});
  ASSERT_EQ(ok.size(), 2u);
  EXPECT_EQ(ok[0], Value(true));
  EXPECT_EQ(ok[1], Value("7"));

  auto payload = newTable();
  auto failed  = call(env, "pcall", {env->getField("error"), Value(payload)});
  ASSERT_EQ(failed.size(), 2u);
  EXPECT_EQ(failed[0], Value(false));
  EXPECT_EQ(failed[1], Value(payload));

  auto notFn = call(env, "pcall", {Value(3)});
  EXPECT_EQ(notFn[0], Value(false));
  EXPECT_EQ(notFn[1], Value("attempt to call a number value"));
}

TEST_F(BaseLib, PrintJoinsWithTabs){
  testing::internal::CaptureStdout();
  call(env, "print", {Value("a"), Value(1), Value()});
  EXPECT_EQ(testing::internal::GetCapturedStdout(), "a\t1\tnil\n");
}
