#pragma once

#include "wiresag/common.hpp"
#include "wiresag/wire.hpp"
#include "wiresag/polynomial.hpp"

namespace wiresag {

struct DipTension {
    double dip = 0.0;      // m
    double tension = 0.0;  // N
};

// Parabolic sag at reference conditions: D = w * S^2 / (8 * T)
double compute_dip(double weight, double span, double tension);

// Inverse relation: T = w * S^2 / (8 * D)
double compute_tension(double weight, double span, double dip);

// Exactly one of dip / tension must be given; the other is computed.
// Only supplied values are checked for positivity.
DipTension compute_dip_or_tension(double weight, double span,
                                  std::optional<double> dip,
                                  std::optional<double> tension);

// Coefficients of the state-change cubics
//   d^3 + d_arg2 * d - d_arg3 = 0
//   t^3 - t_arg2 * t^2 - t_arg3 = 0
// for a temperature change from reference_temperature to temperature.
struct StateChangeCoefficients {
    double dip0 = 0.0;    // Dip at the reference temperature (m)
    double d_arg2 = 0.0;  // m^2
    double d_arg3 = 0.0;  // m^3
    double t_arg2 = 0.0;  // N
    double t_arg3 = 0.0;  // N^3
};

StateChangeCoefficients state_change_coefficients(
    const WireProperties& wire, double span, double tension_ref,
    double temperature, double reference_temperature);

// Dip and tension at `temperature` given the tension measured at
// `reference_temperature`. Accounts for thermal elongation and elastic
// stretch of the conductor. Throws NumericalDivergence if either cubic
// has no admissible positive root.
DipTension compute_temperature_adjusted(
    const WireProperties& wire, double span, double tension_ref,
    double temperature, double reference_temperature,
    const RootSelectionConfig& config = RootSelectionConfig());

// compute_temperature_adjusted for each entry of `temperatures`, in order.
// States are independent and evaluated in parallel (max_threads = 0: OpenMP default).
std::vector<DipTension> temperature_sweep(
    const WireProperties& wire, double span, double tension_ref,
    const Eigen::VectorXd& temperatures, double reference_temperature,
    const RootSelectionConfig& config = RootSelectionConfig(),
    int max_threads = 0);

}  // namespace wiresag
