/// @file src/particles/filter.cpp
/// @brief Spatial particle filters (disc, sphere).

#include "kdc/particles.hpp"

#include <cmath>

namespace kdc {

ParticleView
disc_subset(const ParticleSet& set, double outer_radius, double half_height) {
    const ScalarField r = set.rxy();
    const auto&       pos = set.positions();

    IndexList idx;
    for (Eigen::Index i = 0; i < set.size(); ++i) {
        if (r(i) < outer_radius && std::abs(pos(i, 2)) < half_height) {
            idx.push_back(i);
        }
    }
    return ParticleView(set, std::move(idx));
}

ParticleView
sphere_subset(const ParticleSet& set, const Vec3& centre, double radius) {
    const auto&  pos = set.positions();
    const double r2  = radius * radius;

    IndexList idx;
    for (Eigen::Index i = 0; i < set.size(); ++i) {
        if ((pos.row(i).transpose() - centre).squaredNorm() < r2) {
            idx.push_back(i);
        }
    }
    return ParticleView(set, std::move(idx));
}

}  // namespace kdc
