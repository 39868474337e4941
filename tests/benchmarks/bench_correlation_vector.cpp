// bench_correlation_vector.cpp - Correlation Vector のベンチマーク
//
// ホットパス（increment / extend / spin）の性能を測定します。
// 性能回帰を検出するための基準値を提供します。

#include <cvec/correlation_vector.hpp>
#include <cvec/spin.hpp>

#include <string>

#include <benchmark/benchmark.h>

namespace {

constexpr const char* kIncomingV1 = "tul4NUsfs9Cl7mOf.1.2.3";
constexpr const char* kIncomingV2 = "KZY+dsX2jEaZesgCPjJ2Ng.1.2.3";

// ===========================================================================
// 生成・パース
// ===========================================================================

static void BM_Create_V1(benchmark::State& state)
{
    for (auto _ : state) {
        auto vector = cvec::CorrelationVector::create(cvec::Version::kV1);
        benchmark::DoNotOptimize(vector);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Create_V1);

static void BM_Create_V2(benchmark::State& state)
{
    for (auto _ : state) {
        auto vector = cvec::CorrelationVector::create(cvec::Version::kV2);
        benchmark::DoNotOptimize(vector);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Create_V2);

static void BM_Extend(benchmark::State& state)
{
    for (auto _ : state) {
        auto extended = cvec::CorrelationVector::extend(kIncomingV2);
        benchmark::DoNotOptimize(extended);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Extend);

static void BM_Extend_Strict(benchmark::State& state)
{
    const cvec::Options strict{.validate_during_creation = true, .spin = {}};
    for (auto _ : state) {
        auto extended = cvec::CorrelationVector::extend(kIncomingV1, strict);
        benchmark::DoNotOptimize(extended);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Extend_Strict);

static void BM_Parse(benchmark::State& state)
{
    for (auto _ : state) {
        auto parsed = cvec::CorrelationVector::parse(kIncomingV1);
        benchmark::DoNotOptimize(parsed);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Parse);

// ===========================================================================
// Increment（CAS ループ）
// ===========================================================================

static void BM_Increment(benchmark::State& state)
{
    auto vector = cvec::CorrelationVector::create();
    if (!vector) {
        state.SkipWithError("create failed");
        return;
    }
    for (auto _ : state) {
        auto value = vector->increment();
        benchmark::DoNotOptimize(value);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Increment);

// 共有インスタンスへの競合（スレッド数を変えて測定）
static cvec::CorrelationVector& shared_vector()
{
    static cvec::CorrelationVector vector = cvec::CorrelationVector::create().value();
    return vector;
}

static void BM_Increment_Contended(benchmark::State& state)
{
    auto& vector = shared_vector();
    for (auto _ : state) {
        auto value = vector.increment();
        benchmark::DoNotOptimize(value);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Increment_Contended)->ThreadRange(1, 8)->UseRealTime();

// ===========================================================================
// Spin
// ===========================================================================

static void BM_Spin_Default(benchmark::State& state)
{
    auto vector = cvec::CorrelationVector::create();
    if (!vector) {
        state.SkipWithError("create failed");
        return;
    }
    const auto value = vector->value();
    for (auto _ : state) {
        auto spun = cvec::spin(value);
        benchmark::DoNotOptimize(spun);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Spin_Default);

}  // namespace
