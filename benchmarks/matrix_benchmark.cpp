#include "container/aggregates.hpp"
#include "container/linalg.hpp"
#include "container/traversal.hpp"
#include <benchmark/benchmark.h>
#include <random>

namespace tessel {

// Writes `written` leading cells with random values, leaving the rest at the
// default so the sparse extent equals `written`.
imatrix random_prefix(std::size_t side, std::size_t written) {
  std::mt19937 rng(42);
  std::uniform_int_distribution<std::int32_t> dist(-1000, 1000);

  imatrix m(side, side, 0);
  for (std::size_t i = 0; i < written; ++i) {
    m = std::move(m).set(m.index_to_position(i), dist(rng));
  }
  return m;
}

// ============================================================================
// FOLDS - sparse traversal stops at the high-water mark
// ============================================================================

static void BM_DenseFold(benchmark::State& state) {
  const std::size_t side = state.range(0);
  imatrix const m = random_prefix(side, side * side / 16);

  for (auto _ : state) {
    auto total = fold_left(
        m, [](std::size_t, std::int32_t v, std::int64_t acc) { return acc + v; },
        std::int64_t{0});
    benchmark::DoNotOptimize(total);
  }
  state.SetItemsProcessed(state.iterations() * m.size());
}

static void BM_SparseFold(benchmark::State& state) {
  const std::size_t side = state.range(0);
  imatrix const m = random_prefix(side, side * side / 16);

  for (auto _ : state) {
    auto total = sparse_fold_left(
        m, [](std::size_t, std::int32_t v, std::int64_t acc) { return acc + v; },
        std::int64_t{0});
    benchmark::DoNotOptimize(total);
  }
  state.SetItemsProcessed(state.iterations() * m.sparse_extent());
}

// ============================================================================
// AGGREGATES
// ============================================================================

static void BM_Sum(benchmark::State& state) {
  const std::size_t side = state.range(0);
  imatrix const m = random_prefix(side, side * side / 2);

  for (auto _ : state) {
    benchmark::DoNotOptimize(sum(m));
  }
}

static void BM_ArgMax(benchmark::State& state) {
  const std::size_t side = state.range(0);
  imatrix const m = random_prefix(side, side * side);

  for (auto _ : state) {
    benchmark::DoNotOptimize(argmax(m));
  }
}

// ============================================================================
// PRODUCT
// ============================================================================

static void BM_Dot(benchmark::State& state) {
  const std::size_t side = state.range(0);
  imatrix const a = random_prefix(side, side * side);
  imatrix const b = random_prefix(side, side * side);

  for (auto _ : state) {
    auto c = dot(a, b);
    benchmark::DoNotOptimize(c.store().cells().data());
  }
  state.SetItemsProcessed(state.iterations() * side * side * side);
}

BENCHMARK(BM_DenseFold)->Arg(64)->Arg(256)->Arg(1024);
BENCHMARK(BM_SparseFold)->Arg(64)->Arg(256)->Arg(1024);
BENCHMARK(BM_Sum)->Arg(64)->Arg(256)->Arg(1024);
BENCHMARK(BM_ArgMax)->Arg(64)->Arg(256);
BENCHMARK(BM_Dot)->Arg(16)->Arg(64);

} // namespace tessel

BENCHMARK_MAIN();
