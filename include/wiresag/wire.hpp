#pragma once

#include "wiresag/common.hpp"

namespace wiresag {

// Physical constants of an overhead conductor, SI units throughout.
struct WireProperties {
    std::string type;                // Catalog designation (may be empty)
    double unit_weight = 0.0;        // Weight per unit length (N/m)
    double cross_section = 0.0;      // Computed cross-section (m^2)
    double elastic_modulus = 0.0;    // Young's modulus (Pa)
    double thermal_expansion = 0.0;  // Linear expansion coefficient (1/degC)

    WireProperties() = default;

    // Minimal record for callers that only know the unit weight.
    // Temperature-adjusted solving rejects such a record.
    explicit WireProperties(double unit_weight);
    WireProperties(double unit_weight, double cross_section,
                   double elastic_modulus, double thermal_expansion);

    // EA (N)
    double axial_stiffness() const { return cross_section * elastic_modulus; }

    void validate() const;
    void validate_thermal() const;
};

}  // namespace wiresag
