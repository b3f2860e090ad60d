#include "wiresag/polynomial.hpp"
#include <unsupported/Eigen/Polynomials>
#include <algorithm>

namespace wiresag {

std::vector<double> real_cubic_roots(double a2, double a1, double a0,
                                     double imag_tolerance) {
    if (!std::isfinite(a2) || !std::isfinite(a1) || !std::isfinite(a0)) {
        throw NumericalDivergence("Cubic coefficients are not finite");
    }

    // Eigen expects coefficients in ascending degree order
    Eigen::Vector4d poly(a0, a1, a2, 1.0);
    Eigen::PolynomialSolver<double, 3> solver;
    solver.compute(poly);

    std::vector<double> roots;
    const auto& z = solver.roots();
    for (int i = 0; i < z.size(); i++) {
        double scale = std::max(1.0, std::abs(z(i)));
        if (std::abs(z(i).imag()) <= imag_tolerance * scale) {
            roots.push_back(z(i).real());
        }
    }
    std::sort(roots.begin(), roots.end());
    return roots;
}

double select_positive_root(const std::vector<double>& roots,
                            const RootSelectionConfig& config,
                            const std::string& what) {
    std::vector<double> positive;
    for (double r : roots) {
        if (r > 0.0 && std::isfinite(r)) {
            positive.push_back(r);
        }
    }
    if (positive.empty()) {
        throw NumericalDivergence("No positive real root for " + what);
    }
    std::sort(positive.begin(), positive.end());

    if (config.policy == RootSelectionConfig::Policy::UNIQUE_POSITIVE) {
        for (size_t i = 1; i < positive.size(); i++) {
            double gap = positive[i] - positive[0];
            if (gap > config.distinct_tolerance * std::max(1.0, positive[i])) {
                throw NumericalDivergence("Ambiguous " + what + ": " +
                                          std::to_string(positive.size()) +
                                          " positive real roots");
            }
        }
    }
    return positive.front();
}

}  // namespace wiresag
