#include "wiresag/span_analysis.hpp"
#include <iostream>
#include <algorithm>
#include <limits>

namespace wiresag {

void SpanScenario::validate() const {
    require_positive(span, "Span must be positive");
    if (!std::isfinite(height1) || (height2 && !std::isfinite(*height2)))
        throw std::invalid_argument("Support heights must be finite");
    if (dip.has_value() == tension.has_value())
        throw std::invalid_argument("Exactly one of dip or tension must be given");
    if (dip) require_positive(*dip, "Dip must be positive");
    if (tension) require_positive(*tension, "Tension must be positive");
    if (!std::isfinite(reference_temperature))
        throw std::invalid_argument("Reference temperature must be finite");
    for (double t : temperatures) {
        if (!std::isfinite(t))
            throw std::invalid_argument("Evaluation temperatures must be finite");
    }
    if (num_samples < 2)
        throw std::invalid_argument("Curve needs at least 2 samples");
}

const SpanState& SpanReport::reference() const {
    for (const auto& s : states) {
        if (s.is_reference) return s;
    }
    throw std::runtime_error("Span report has no reference state");
}

double SpanReport::max_dip() const {
    double d = 0.0;
    for (const auto& s : states) d = std::max(d, s.dip);
    return d;
}

double SpanReport::max_tension() const {
    double t = 0.0;
    for (const auto& s : states) t = std::max(t, s.tension);
    return t;
}

Eigen::Vector2d SpanReport::lowest_point() const {
    if (states.empty())
        throw std::runtime_error("Span report is empty");

    Eigen::Vector2d best(0.0, std::numeric_limits<double>::infinity());
    for (const auto& s : states) {
        int idx = s.curve.lowest_sample();
        if (idx >= 0 && s.curve.y(idx) < best(1)) {
            best << s.curve.x(idx), s.curve.y(idx);
        }
    }
    return best;
}

SpanAnalyzer::SpanAnalyzer(const WireProperties& wire, double allowable_tension)
    : wire_(wire), allowable_tension_(allowable_tension) {
    wire_.validate();
    if (allowable_tension_ < 0.0 || !std::isfinite(allowable_tension_))
        throw std::invalid_argument("Allowable tension must be non-negative");
}

SpanState SpanAnalyzer::make_state(const SpanScenario& scenario, double temperature,
                                   bool is_reference, const DipTension& solution) const {
    if (solution.dip >= scenario.span) {
        throw std::invalid_argument(
            "Dip " + std::to_string(solution.dip) + " m at " + std::to_string(temperature) +
            " degC is not smaller than span " + std::to_string(scenario.span) + " m");
    }

    SpanState state;
    state.temperature = temperature;
    state.is_reference = is_reference;
    state.dip = solution.dip;
    state.tension = solution.tension;
    state.curve = generate_curve(wire_.unit_weight, scenario.span, solution.tension,
                                 solution.dip, scenario.height1, scenario.height2,
                                 scenario.num_samples);
    state.apex_offset = state.curve.apex_offset;
    state.sag_ratio = solution.dip / scenario.span;
    if (allowable_tension_ > 0.0) {
        state.tension_utilization = solution.tension / allowable_tension_;
    }

    if (state.sag_ratio > PARABOLIC_SAG_RATIO_LIMIT) {
        std::cerr << "[SpanAnalyzer] Warning: sag ratio " << state.sag_ratio
                  << " at " << temperature << " degC exceeds "
                  << PARABOLIC_SAG_RATIO_LIMIT
                  << ", parabolic approximation is coarse\n";
    }
    if (state.tension_utilization > 1.0) {
        std::cerr << "[SpanAnalyzer] Warning: tension " << solution.tension
                  << " N at " << temperature << " degC exceeds allowable "
                  << allowable_tension_ << " N\n";
    }
    return state;
}

SpanReport SpanAnalyzer::analyze(const SpanScenario& scenario, int max_threads) const {
    scenario.validate();

    DipTension ref = compute_dip_or_tension(wire_.unit_weight, scenario.span,
                                            scenario.dip, scenario.tension);
    SpanReport report;
    report.states.reserve(1 + scenario.temperatures.size());
    report.states.push_back(
        make_state(scenario, scenario.reference_temperature, true, ref));

    if (!scenario.temperatures.empty()) {
        Eigen::VectorXd temps = Eigen::Map<const Eigen::VectorXd>(
            scenario.temperatures.data(),
            static_cast<Eigen::Index>(scenario.temperatures.size()));

        auto adjusted = temperature_sweep(wire_, scenario.span, ref.tension, temps,
                                          scenario.reference_temperature,
                                          scenario.root_selection, max_threads);

        for (size_t i = 0; i < adjusted.size(); i++) {
            report.states.push_back(
                make_state(scenario, scenario.temperatures[i], false, adjusted[i]));
        }
    }

    return report;
}

}  // namespace wiresag
