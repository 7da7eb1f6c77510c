/**
 * @file  bench/bench_pipeline.cpp
 * @brief Google Benchmark suite for the ridership pipeline stages.
 *
 * Benchmarks
 * ----------
 *   BM_IntervalNormalize   readings → hourly rates
 *   BM_TimeBucket          rates → (device, bucket) grid
 *   BM_Aggregate           bucketed rates → (station, bucket) aggregates
 *   BM_Score               aggregate batch → priorities (Eigen)
 *   BM_FullPipeline        end to end, station grouping
 *
 * Build (CMake):
 *   cmake -DRIDERSHIP_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_pipeline
 *   ./build/bench_pipeline --benchmark_format=json
 *
 * The range argument is the number of devices. Every device reports every
 * four hours for one week, spread over devices/8 stations.
 * Throughput units: items/second (readings or records processed).
 */

#include "benchmark/benchmark.h"

#include "ridership/aggregator.hpp"
#include "ridership/bucketer.hpp"
#include "ridership/interval.hpp"
#include "ridership/pipeline.hpp"
#include "ridership/scorer.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using namespace ridership;

// ── Fixture helpers ────────────────────────────────────────────────────────────

namespace {

constexpr Timestamp kStep     = 4 * 3600;
constexpr std::size_t kPerDay = 6;
constexpr std::size_t kDays   = 7;

struct Network {
    NetworkTopology      topology;
    std::vector<Reading> readings;
};

/// Synthetic network of `devices` turnstiles with deterministic counts.
Network make_network(std::size_t devices) {
    Network net;
    const std::size_t stations = devices / 8 > 0 ? devices / 8 : 1;
    for (std::size_t s = 0; s < stations; ++s) {
        net.topology.register_station(StationKey{"S" + std::to_string(s), "1"});
    }

    net.readings.reserve(devices * kPerDay * kDays);
    for (std::size_t d = 0; d < devices; ++d) {
        const StationId station{static_cast<std::uint32_t>(d % stations)};
        const DeviceId device = net.topology.register_device(
            DeviceKey{"A", "R", std::to_string(d), "S" + std::to_string(station.value)},
            station);
        for (std::size_t k = 0; k < kPerDay * kDays; ++k) {
            net.readings.push_back(Reading{
                .device        = device,
                .station       = station,
                .timestamp     = static_cast<Timestamp>(k) * kStep,
                .net_increment = k == 0 ? 0u : (d * 31u + k * 17u) % 400u,
            });
        }
    }
    return net;
}

}  // namespace

// ── Stage benchmarks ───────────────────────────────────────────────────────────

static void BM_IntervalNormalize(benchmark::State& state) {
    const auto net = make_network(static_cast<std::size_t>(state.range(0)));
    const interval::IntervalNormalizer normalizer;
    for (auto _ : state) {
        DiagnosticLog log;
        auto rates = normalizer.normalize(net.readings, log);
        benchmark::DoNotOptimize(rates.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(net.readings.size()));
}
BENCHMARK(BM_IntervalNormalize)->RangeMultiplier(4)->Range(64, 4096)->Unit(benchmark::kMicrosecond);

static void BM_TimeBucket(benchmark::State& state) {
    const auto net = make_network(static_cast<std::size_t>(state.range(0)));
    DiagnosticLog log;
    const auto rates = interval::IntervalNormalizer{}.normalize(net.readings, log);
    const auto bucketer = bucket::TimeBucketer::make(3600);
    for (auto _ : state) {
        auto bucketed = bucketer->bucket(rates);
        benchmark::DoNotOptimize(bucketed.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(rates.size()));
}
BENCHMARK(BM_TimeBucket)->RangeMultiplier(4)->Range(64, 4096)->Unit(benchmark::kMicrosecond);

static void BM_Aggregate(benchmark::State& state) {
    const auto net = make_network(static_cast<std::size_t>(state.range(0)));
    DiagnosticLog log;
    const auto rates    = interval::IntervalNormalizer{}.normalize(net.readings, log);
    const auto bucketed = bucket::TimeBucketer::make(3600)->bucket(rates);
    const aggregate::MultiKeyAggregator aggregator;
    for (auto _ : state) {
        DiagnosticLog run_log;
        auto table = aggregator.aggregate(bucketed, net.topology, run_log);
        benchmark::DoNotOptimize(table.records.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(bucketed.size()));
}
BENCHMARK(BM_Aggregate)->RangeMultiplier(4)->Range(64, 4096)->Unit(benchmark::kMicrosecond);

static void BM_Score(benchmark::State& state) {
    const auto net = make_network(static_cast<std::size_t>(state.range(0)));
    DiagnosticLog log;
    const auto rates    = interval::IntervalNormalizer{}.normalize(net.readings, log);
    const auto bucketed = bucket::TimeBucketer::make(3600)->bucket(rates);
    const auto table    = aggregate::MultiKeyAggregator{}.aggregate(bucketed, net.topology, log);
    const scoring::PriorityScorer scorer;
    for (auto _ : state) {
        DiagnosticLog run_log;
        auto scored = scorer.score(table.records, run_log);
        benchmark::DoNotOptimize(scored);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(table.records.size()));
}
BENCHMARK(BM_Score)->RangeMultiplier(4)->Range(64, 4096)->Unit(benchmark::kMicrosecond);

// ── End to end ─────────────────────────────────────────────────────────────────

static void BM_FullPipeline(benchmark::State& state) {
    const auto net = make_network(static_cast<std::size_t>(state.range(0)));
    const core::Pipeline pipeline;
    for (auto _ : state) {
        auto result = pipeline.run(net.readings, net.topology);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(net.readings.size()));
}
BENCHMARK(BM_FullPipeline)->RangeMultiplier(4)->Range(64, 4096)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
