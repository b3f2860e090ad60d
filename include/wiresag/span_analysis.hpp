#pragma once

#include "wiresag/common.hpp"
#include "wiresag/wire.hpp"
#include "wiresag/polynomial.hpp"
#include "wiresag/dip_tension.hpp"
#include "wiresag/catenary.hpp"

namespace wiresag {

struct SpanScenario {
    double span = 50.0;                    // m
    double height1 = 10.0;                 // Support 1 height (m)
    std::optional<double> height2;         // Support 2 height (m), empty = level span

    // Reference condition: give exactly one
    std::optional<double> dip;             // m
    std::optional<double> tension;         // N

    double reference_temperature = 10.0;   // degC
    std::vector<double> temperatures;      // Extra evaluation temperatures (degC)

    int num_samples = DEFAULT_CURVE_SAMPLES;
    RootSelectionConfig root_selection;

    void validate() const;
};

struct SpanState {
    double temperature = 0.0;         // degC
    bool is_reference = false;
    double dip = 0.0;                 // m
    double tension = 0.0;             // N
    double apex_offset = 0.0;         // m
    double sag_ratio = 0.0;           // dip / span
    double tension_utilization = 0.0; // tension / allowable, 0 if unchecked
    CatenaryCurve curve;
};

struct SpanReport {
    // Reference state first, then scenario.temperatures in order
    std::vector<SpanState> states;

    const SpanState& reference() const;
    double max_dip() const;
    double max_tension() const;

    // Lowest sampled point over all curves: (x, y) in m
    Eigen::Vector2d lowest_point() const;
};

class SpanAnalyzer {
public:
    // allowable_tension: working tension limit (N), 0 disables the check
    explicit SpanAnalyzer(const WireProperties& wire, double allowable_tension = 0.0);

    // Throws std::invalid_argument if any state's dip reaches the span
    SpanReport analyze(const SpanScenario& scenario, int max_threads = 0) const;

    const WireProperties& wire() const { return wire_; }
    double allowable_tension() const { return allowable_tension_; }

private:
    WireProperties wire_;
    double allowable_tension_;

    SpanState make_state(const SpanScenario& scenario, double temperature,
                         bool is_reference, const DipTension& solution) const;
};

}  // namespace wiresag
