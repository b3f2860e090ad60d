#pragma once

#include <Eigen/Dense>
#include <vector>
#include <string>
#include <optional>
#include <cmath>
#include <stdexcept>

namespace wiresag {

// Sample count of a rendered span curve (both supports included)
constexpr int DEFAULT_CURVE_SAMPLES = 100;

// Sag-to-span ratio above which the parabolic approximation loses accuracy
constexpr double PARABOLIC_SAG_RATIO_LIMIT = 0.1;

// Raised when a state-change cubic yields no admissible positive real root.
// Physically the wire would go slack or the model has left its valid range.
class NumericalDivergence : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Throws std::invalid_argument unless value is positive and finite
inline void require_positive(double value, const char* message) {
    if (!(value > 0.0) || !std::isfinite(value))
        throw std::invalid_argument(message);
}

}  // namespace wiresag
