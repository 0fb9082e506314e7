/// @file src/decomp/classifier.cpp
/// @brief Component Classifier: five-way labelling of stars.

#include "kdc/decomp.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace kdc::decomp {

ComponentLabel classify_star(double te, double ratio,
                             const ClassifyParams& p) noexcept {
    if (std::isnan(ratio)) {
        ratio = 0.0;
    }

    // Pass 1: disk band.
    if (ratio > p.j_disk_min && ratio < p.j_disk_max) {
        return ComponentLabel::ThinDisk;
    }

    // Pass 2: everything outside the band.
    const bool bound = te <= p.e_cut;
    if (ratio < p.j_crit) {
        return bound ? ComponentLabel::Bulge : ComponentLabel::Halo;
    }
    return bound ? ComponentLabel::PseudoBulge : ComponentLabel::ThickDisk;
}

LabelField classify_components(const ScalarField& te, const ScalarField& ratio,
                               const ClassifyParams& params) {
    LabelField labels(te.size());
    for (Eigen::Index i = 0; i < te.size(); ++i) {
        labels(i) = static_cast<int>(classify_star(te(i), ratio(i), params));
    }
    return labels;
}

double median(const ScalarField& values) {
    if (values.size() == 0) {
        return std::nan("");
    }
    std::vector<double> v(values.data(), values.data() + values.size());
    const std::size_t mid = v.size() / 2;
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid), v.end());
    const double upper = v[mid];
    if (v.size() % 2 == 1) {
        return upper;
    }
    const double lower = *std::max_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid));
    return 0.5 * (lower + upper);
}

std::array<Eigen::Index, NUM_COMPONENTS + 1>
component_counts(const LabelField& labels) noexcept {
    std::array<Eigen::Index, NUM_COMPONENTS + 1> counts{};
    for (Eigen::Index i = 0; i < labels.size(); ++i) {
        const int l = labels(i);
        if (l >= 0 && l <= NUM_COMPONENTS) {
            ++counts[static_cast<std::size_t>(l)];
        }
    }
    return counts;
}

}  // namespace kdc::decomp
