/**
 * @file  bench/bench_decomp.cpp
 * @brief Google Benchmark suite for the kinematic decomposition.
 *
 * Benchmarks
 * ----------
 *   BM_Decompose_Aligned     — full pipeline, frame already face-on
 *   BM_Decompose_WithAlign   — full pipeline including alignment
 *   BM_RadialProfile         — equal-population rotation curve only
 *   BM_JcircFromEnergy       — energy → j_circ lookup, linear and log10
 *   BM_Classify              — five-way classification of the stars
 *
 * Build (CMake):
 *   cmake -DKDC_BUILD_BENCH=ON ..
 *   cmake --build . --target bench_decomp
 *   ./bench_decomp --benchmark_format=json
 *
 * Throughput units: items/second (particles processed).
 */

#include "benchmark/benchmark.h"

#include "kdc/decomp.hpp"
#include "kdc/log.hpp"
#include "support/synthetic_galaxy.hpp"

#include <string_view>

using namespace kdc;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Galaxy with `n` disk stars and half as many spheroid and halo particles.
static kdc::testing::Galaxy make_scaled_galaxy(Eigen::Index n) {
    return kdc::testing::make_galaxy(kdc::testing::GalaxyParams{
        .n_disk = n, .n_spheroid = n / 2, .n_dm = n / 2});
}

static void silence_log() {
    log::set_sink([](log::Level, std::string_view) {});
}

// ── Full pipeline ──────────────────────────────────────────────────────────────

static void BM_Decompose_Aligned(benchmark::State& state) {
    silence_log();
    auto g = make_scaled_galaxy(state.range(0));
    decomp::DecompConfig cfg;
    cfg.aligned = true;
    for (auto _ : state) {
        auto r = decomp::decompose(g.set, cfg);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations() * g.set.size());
    log::reset_sink();
}
BENCHMARK(BM_Decompose_Aligned)->RangeMultiplier(4)->Range(4096, 65536)
    ->Unit(benchmark::kMillisecond);

static void BM_Decompose_WithAlign(benchmark::State& state) {
    silence_log();
    auto g = make_scaled_galaxy(state.range(0));
    for (auto _ : state) {
        auto r = decomp::decompose(g.set);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations() * g.set.size());
    log::reset_sink();
}
BENCHMARK(BM_Decompose_WithAlign)->RangeMultiplier(4)->Range(4096, 65536)
    ->Unit(benchmark::kMillisecond);

// ── Stages ─────────────────────────────────────────────────────────────────────

static void BM_RadialProfile(benchmark::State& state) {
    auto g = make_scaled_galaxy(state.range(0));
    const auto all   = g.set.all();
    const int  nbins = static_cast<int>(g.set.size() / 500);
    for (auto _ : state) {
        auto pro = profile::RadialProfile::build(all, nbins, units::km2_per_s2());
        benchmark::DoNotOptimize(pro);
    }
    state.SetItemsProcessed(state.iterations() * g.set.size());
}
BENCHMARK(BM_RadialProfile)->RangeMultiplier(4)->Range(4096, 262144);

static void BM_JcircFromEnergy(benchmark::State& state) {
    silence_log();
    auto g = make_scaled_galaxy(65536);
    const auto energy = decomp::build_energy_field(g.set);
    const auto pro    = profile::RadialProfile::build(
        g.set.all(), static_cast<int>(g.set.size() / 500), energy->unit);
    const bool log_interp = state.range(0) != 0;
    for (auto _ : state) {
        auto j = decomp::jcirc_from_energy(*pro, energy->te, log_interp);
        benchmark::DoNotOptimize(j);
    }
    state.SetItemsProcessed(state.iterations() * g.set.size());
    log::reset_sink();
}
BENCHMARK(BM_JcircFromEnergy)->Arg(0)->Arg(1);

static void BM_Classify(benchmark::State& state) {
    const Eigen::Index n = state.range(0);
    const ScalarField te    = ScalarField::LinSpaced(n, -1e5, 0.0);
    const ScalarField ratio = ScalarField::LinSpaced(n, -1.5, 2.5);
    const decomp::ClassifyParams p{.e_cut = -5e4, .j_crit = 0.3,
                                   .j_disk_min = 0.8, .j_disk_max = 1.1};
    for (auto _ : state) {
        auto labels = decomp::classify_components(te, ratio, p);
        benchmark::DoNotOptimize(labels.data());
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_Classify)->RangeMultiplier(8)->Range(1024, 1 << 20);
