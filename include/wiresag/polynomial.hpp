#pragma once

#include "wiresag/common.hpp"

namespace wiresag {

struct RootSelectionConfig {
    enum class Policy {
        SMALLEST_POSITIVE,  // Take the smallest positive real root
        UNIQUE_POSITIVE     // Fail if more than one distinct positive root exists
    };
    Policy policy = Policy::SMALLEST_POSITIVE;

    // |Im(z)| <= imag_tolerance * max(1, |z|) counts as a real root
    double imag_tolerance = 1e-9;

    // Positive roots closer than distinct_tolerance * max(1, |r|) are one root
    double distinct_tolerance = 1e-9;
};

// Real roots of the monic cubic x^3 + a2*x^2 + a1*x + a0, ascending.
// Roots come from the eigenvalues of the companion matrix, no iteration.
std::vector<double> real_cubic_roots(double a2, double a1, double a0,
                                     double imag_tolerance = 1e-9);

// Pick the admissible positive root according to config.policy.
// `what` names the unknown in error messages ("dip", "tension").
double select_positive_root(const std::vector<double>& roots,
                            const RootSelectionConfig& config,
                            const std::string& what);

}  // namespace wiresag
