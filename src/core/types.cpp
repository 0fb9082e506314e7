/// @file src/core/types.cpp
/// @brief String conversions for the shared enumerations.

#include "kdc/types.hpp"

namespace kdc {

const char* to_string(Family f) noexcept {
    switch (f) {
        case Family::DarkMatter: return "dm";
        case Family::Gas:        return "gas";
        case Family::Star:       return "star";
    }
    return "unknown";
}

const char* to_string(ComponentLabel c) noexcept {
    switch (c) {
        case ComponentLabel::Unset:       return "unset";
        case ComponentLabel::ThinDisk:    return "thin disk";
        case ComponentLabel::Halo:        return "halo";
        case ComponentLabel::Bulge:       return "bulge";
        case ComponentLabel::ThickDisk:   return "thick disk";
        case ComponentLabel::PseudoBulge: return "pseudo bulge";
    }
    return "unknown";
}

}  // namespace kdc
