#include <benchmark/benchmark.h>
#include "../../Application/bcvm-assembler/emitter.hpp"
#include "../../Application/bcvm-loader/deserializer.hpp"
#include "../../Application/bcvm-vm/vm.hpp"
#include "../../Domain/bcvm-core/table.hpp"

// for i = 1, n do sum += i end; return sum
static std::string sum_loop(int16_t n) {
  bcvm::ModuleBuilder mb;
  auto &p = mb.proto();
  p.maxStack(4);
  p.ad(bcvm::OP_LOADN, 0, 0);
  p.ad(bcvm::OP_LOADN, 1, n);
  p.ad(bcvm::OP_LOADN, 2, 1);
  p.ad(bcvm::OP_LOADN, 3, 1);
  uint32_t prep = p.ad(bcvm::OP_FORNPREP, 1, 0);
  uint32_t body = p.abc(bcvm::OP_ADD, 0, 0, 3);
  uint32_t loop = p.ad(bcvm::OP_FORNLOOP, 1, 0);
  p.patchD(loop, body);
  uint32_t exit = p.abc(bcvm::OP_RETURN, 0, 2);
  p.patchD(prep, exit);
  return mb.serialize();
}

static void BM_Deserialize(benchmark::State &state) {
  auto bytes = sum_loop(1000);
  for (auto _ : state) {
    auto mod = bcvm::deserialize(bytes);
    benchmark::DoNotOptimize(mod);
  }
}

BENCHMARK(BM_Deserialize);

static void BM_LoadAndRun(benchmark::State &state) {
  auto bytes = sum_loop(1000);
  for (auto _ : state) {
    auto entry = bcvm::load(bytes, std::make_shared<bcvm::Table>());
    auto v     = entry.main->call({});
    benchmark::DoNotOptimize(v);
  }
}

BENCHMARK(BM_LoadAndRun);

static void BM_RunOnly(benchmark::State &state) {
  auto entry = bcvm::load(sum_loop((int16_t)state.range(0)), std::make_shared<bcvm::Table>());
  for (auto _ : state) {
    auto v = entry.main->call({});
    benchmark::DoNotOptimize(v);
  }
}

BENCHMARK(BM_RunOnly)->Arg(100)->Arg(10000);

BENCHMARK_MAIN();
