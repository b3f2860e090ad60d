#include "wiresag/wire.hpp"

namespace wiresag {

WireProperties::WireProperties(double unit_weight)
    : unit_weight(unit_weight) {
    validate();
}

WireProperties::WireProperties(double unit_weight, double cross_section,
                               double elastic_modulus, double thermal_expansion)
    : unit_weight(unit_weight), cross_section(cross_section),
      elastic_modulus(elastic_modulus), thermal_expansion(thermal_expansion) {
    validate();
}

void WireProperties::validate() const {
    if (!(unit_weight > 0.0) || !std::isfinite(unit_weight))
        throw std::invalid_argument("Unit weight must be positive");
    if (cross_section < 0.0 || !std::isfinite(cross_section))
        throw std::invalid_argument("Cross-section must be non-negative");
    if (elastic_modulus < 0.0 || !std::isfinite(elastic_modulus))
        throw std::invalid_argument("Elastic modulus must be non-negative");
    if (!std::isfinite(thermal_expansion))
        throw std::invalid_argument("Thermal expansion coefficient must be finite");
}

void WireProperties::validate_thermal() const {
    validate();
    if (cross_section <= 0.0)
        throw std::invalid_argument(
            "Cross-section must be positive for temperature-adjusted solving");
    if (elastic_modulus <= 0.0)
        throw std::invalid_argument(
            "Elastic modulus must be positive for temperature-adjusted solving");
}

}  // namespace wiresag
