/**
 * @file  bench/bench_value_at.cpp
 * @brief Google Benchmark suite for temporal lookups and codec throughput.
 *
 * Benchmarks
 * ----------
 *   BM_Sequence_ValueAt      binary search plus one interpolation
 *   BM_SequenceSet_ValueAt   two-level binary search
 *   BM_Sequence_AtValue      linear crossing scan
 *   BM_Wkb_Encode / Decode
 *   BM_Wkt_Parse
 *
 * Build (CMake):
 *   cmake -DTEMPUS_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_value_at
 *   ./build/bench_value_at --benchmark_format=json
 *
 * Throughput units: items/second (instants processed).
 */

#include "benchmark/benchmark.h"

#include "tempus/time.hpp"
#include "tempus/tsequence_set.hpp"
#include "tempus/wkb.hpp"
#include "tempus/wkt.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

using namespace tempus;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static Timestamp origin() {
    return *make_timestamp(2000, 1, 1);
}

/// N-instant Linear float sequence, one sample per minute, sinusoidal values.
static TSequence make_sequence(std::size_t n) {
    std::vector<TInstant> instants;
    instants.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        instants.emplace_back(std::sin(static_cast<double>(i) * 0.01),
                              origin() + std::chrono::minutes(i));
    }
    return *TSequence::make(std::move(instants), Interpolation::Linear);
}

/// N members of 16 instants each, separated by one-hour gaps.
static TSequenceSet make_sequence_set(std::size_t n) {
    std::vector<TSequence> members;
    members.reserve(n);
    for (std::size_t m = 0; m < n; ++m) {
        std::vector<TInstant> instants;
        const Timestamp start = origin() + std::chrono::hours(2 * m);
        for (std::size_t i = 0; i < 16; ++i) {
            instants.emplace_back(static_cast<double>(i), start + std::chrono::minutes(i));
        }
        members.push_back(*TSequence::make(std::move(instants), Interpolation::Linear));
    }
    return *TSequenceSet::make(std::move(members));
}

// ── Lookups ────────────────────────────────────────────────────────────────────

static void BM_Sequence_ValueAt(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const TSequence seq = make_sequence(n);
    const auto span_us  = std::chrono::duration_cast<std::chrono::microseconds>(seq.duration()).count();
    std::int64_t step   = 0;
    for (auto _ : state) {
        const Timestamp t = origin() + std::chrono::microseconds((step * 7919) % span_us);
        benchmark::DoNotOptimize(seq.value_at(t));
        ++step;
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Sequence_ValueAt)->RangeMultiplier(8)->Range(64, 262144);

static void BM_SequenceSet_ValueAt(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const TSequenceSet set = make_sequence_set(n);
    std::int64_t step = 0;
    for (auto _ : state) {
        const auto member = static_cast<std::int64_t>(static_cast<std::size_t>(step) % n);
        const Timestamp t = origin() + std::chrono::hours(2 * member) + std::chrono::seconds(step % 900);
        benchmark::DoNotOptimize(set.value_at(t));
        ++step;
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_SequenceSet_ValueAt)->RangeMultiplier(8)->Range(8, 32768);

static void BM_Sequence_AtValue(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const TSequence seq = make_sequence(n);
    for (auto _ : state) {
        benchmark::DoNotOptimize(seq.at_value(Value(0.5)));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Sequence_AtValue)->RangeMultiplier(8)->Range(64, 32768)->Unit(benchmark::kMicrosecond);

// ── Codecs ─────────────────────────────────────────────────────────────────────

static void BM_Wkb_Encode(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const Temporal seq = make_sequence(n);
    for (auto _ : state) {
        benchmark::DoNotOptimize(codec::to_wkb(seq));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Wkb_Encode)->RangeMultiplier(8)->Range(64, 32768)->Unit(benchmark::kMicrosecond);

static void BM_Wkb_Decode(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const codec::Bytes bytes = codec::to_wkb(make_sequence(n));
    for (auto _ : state) {
        benchmark::DoNotOptimize(codec::temporal_from_wkb(bytes));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(bytes.size()));
}
BENCHMARK(BM_Wkb_Decode)->RangeMultiplier(8)->Range(64, 32768)->Unit(benchmark::kMicrosecond);

static void BM_Wkt_Parse(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const std::string text = codec::to_wkt(make_sequence(n));
    for (auto _ : state) {
        benchmark::DoNotOptimize(codec::temporal_from_wkt(text, ValueType::Float));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_Wkt_Parse)->RangeMultiplier(8)->Range(64, 32768)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
