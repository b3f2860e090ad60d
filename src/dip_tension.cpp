#include "wiresag/dip_tension.hpp"
#include <exception>
#include <omp.h>

namespace wiresag {

double compute_dip(double weight, double span, double tension) {
    require_positive(weight, "Unit weight must be positive");
    require_positive(span, "Span must be positive");
    require_positive(tension, "Tension must be positive");
    return weight * span * span / (8.0 * tension);
}

double compute_tension(double weight, double span, double dip) {
    require_positive(weight, "Unit weight must be positive");
    require_positive(span, "Span must be positive");
    require_positive(dip, "Dip must be positive");
    return weight * span * span / (8.0 * dip);
}

DipTension compute_dip_or_tension(double weight, double span,
                                  std::optional<double> dip,
                                  std::optional<double> tension) {
    if (dip.has_value() == tension.has_value()) {
        throw std::invalid_argument("Exactly one of dip or tension must be given");
    }

    DipTension result;
    if (dip) {
        result.dip = *dip;
        result.tension = compute_tension(weight, span, *dip);
    } else {
        result.tension = *tension;
        result.dip = compute_dip(weight, span, *tension);
    }
    return result;
}

StateChangeCoefficients state_change_coefficients(
    const WireProperties& wire, double span, double tension_ref,
    double temperature, double reference_temperature)
{
    wire.validate_thermal();
    if (!std::isfinite(temperature) || !std::isfinite(reference_temperature))
        throw std::invalid_argument("Temperatures must be finite");

    const double w = wire.unit_weight;
    const double EA = wire.axial_stiffness();
    const double S2 = span * span;

    StateChangeCoefficients c;
    c.dip0 = compute_dip(w, span, tension_ref);

    // Thermal strain converted to an equivalent axial force
    double thermal_force = EA * wire.thermal_expansion * (temperature - reference_temperature);

    c.d_arg2 = (3.0 * S2) / (8.0 * EA) * (tension_ref - thermal_force) - c.dip0 * c.dip0;
    c.d_arg3 = (3.0 * w * S2 * S2) / (64.0 * EA);

    c.t_arg2 = tension_ref - (8.0 * EA * c.dip0 * c.dip0) / (3.0 * S2) - thermal_force;
    c.t_arg3 = (EA * w * w * S2) / 24.0;
    return c;
}

DipTension compute_temperature_adjusted(
    const WireProperties& wire, double span, double tension_ref,
    double temperature, double reference_temperature,
    const RootSelectionConfig& config)
{
    StateChangeCoefficients c = state_change_coefficients(
        wire, span, tension_ref, temperature, reference_temperature);

    DipTension result;

    // d^3 + 0*d^2 + d_arg2*d - d_arg3 = 0
    auto dip_roots = real_cubic_roots(0.0, c.d_arg2, -c.d_arg3, config.imag_tolerance);
    result.dip = select_positive_root(dip_roots, config, "dip");

    // t^3 - t_arg2*t^2 + 0*t - t_arg3 = 0
    auto tension_roots = real_cubic_roots(-c.t_arg2, 0.0, -c.t_arg3, config.imag_tolerance);
    result.tension = select_positive_root(tension_roots, config, "tension");

    return result;
}

std::vector<DipTension> temperature_sweep(
    const WireProperties& wire, double span, double tension_ref,
    const Eigen::VectorXd& temperatures, double reference_temperature,
    const RootSelectionConfig& config, int max_threads)
{
    const int n = static_cast<int>(temperatures.size());
    std::vector<DipTension> results(n);
    std::vector<std::exception_ptr> errors(n);

    int n_threads = (max_threads > 0) ? max_threads : omp_get_max_threads();

    #pragma omp parallel for schedule(static) num_threads(n_threads)
    for (int i = 0; i < n; i++) {
        try {
            results[i] = compute_temperature_adjusted(
                wire, span, tension_ref, temperatures(i),
                reference_temperature, config);
        } catch (...) {
            errors[i] = std::current_exception();
        }
    }

    for (int i = 0; i < n; i++) {
        if (errors[i]) std::rethrow_exception(errors[i]);
    }
    return results;
}

}  // namespace wiresag
