/**
 * @file  fuzz_reference_curve.cpp
 * @brief libFuzzer target for ReferenceCurve, bisect and the classifier.
 *
 * Build:
 *   cmake -DKDC_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_reference_curve
 *
 * Run for 60 seconds:
 *   ./fuzz_reference_curve -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. ReferenceCurve::build never crashes on NaN, inf, duplicates or
 *      unsorted samples, and a built curve has strictly increasing x.
 *   2. Evaluation is NaN outside [x_min, x_max].
 *   3. bisect terminates within max_iterations for any objective.
 *   4. classify_star always returns a label in 1..5.
 *
 * Fuzzer strategy:
 *   Bytes interpreted as a flat array of doubles: the first half are
 *   abscissae, the second half ordinates; the trailing double is a probe.
 */

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <cmath>
#include <span>
#include <vector>

#include "kdc/decomp.hpp"
#include "kdc/numeric.hpp"

using namespace kdc;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const size_t count = size / sizeof(double);
    if (count < 3) {
        return 0;
    }
    std::vector<double> values(count);
    std::memcpy(values.data(), data, count * sizeof(double));

    const double probe = values.back();
    const size_t half  = (count - 1) / 2;
    const std::span<const double> x(values.data(), half);
    const std::span<const double> y(values.data() + half, half);

    // ── Test 1 & 2: reference curve ──────────────────────────────────────────
    if (const auto curve = numeric::ReferenceCurve::build(x, y)) {
        const auto& cx = curve->x();
        for (size_t i = 1; i < cx.size(); ++i) {
            if (!(cx[i] > cx[i - 1])) std::abort();
        }
        const double v = (*curve)(probe);
        const bool inside = probe >= curve->x_min() && probe <= curve->x_max();
        if (!inside && !std::isnan(v)) std::abort();
    }

    // ── Test 3: bisection terminates ─────────────────────────────────────────
    const numeric::BisectConfig cfg{.max_iterations = 64};
    const auto r = numeric::bisect(0.0, 5.0, [&](double c) {
        return std::sin(c * probe) + (half > 0 ? x[0] : 0.0);
    }, cfg);
    if (r.iterations > cfg.max_iterations) std::abort();

    // ── Test 4: classifier totality ──────────────────────────────────────────
    const decomp::ClassifyParams p{.e_cut = values[0], .j_crit = values[1],
                                   .j_disk_min = 0.8, .j_disk_max = 1.1};
    const int label = static_cast<int>(decomp::classify_star(probe, values[count - 2], p));
    if (label < 1 || label > NUM_COMPONENTS) std::abort();

    return 0;
}
