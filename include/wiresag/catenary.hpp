#pragma once

#include "wiresag/common.hpp"

namespace wiresag {

// Sampled parabolic span profile between two supports.
struct CatenaryCurve {
    Eigen::VectorXd x;          // Horizontal distance from support 1 (m)
    Eigen::VectorXd y;          // Height (m)
    double apex_offset = 0.0;   // Horizontal position of the vertex (m)
    double apex_height = 0.0;   // Height of the vertex (m)

    int num_samples() const { return static_cast<int>(x.size()); }

    // Index of the lowest sample
    int lowest_sample() const;
};

// Horizontal vertex position. Level span when height_difference is empty,
// otherwise the vertex moves toward the lower support:
//   a = S/2 - T * (h2 - h1) / (w * S)
double apex_offset(double weight, double span, double tension,
                   std::optional<double> height_difference = std::nullopt);

// Sample the span profile on `num_samples` points over [0, span].
//
// Level span (height2 empty):
//   y(x) = w/(2T) * (x - S/2)^2 + (height1 - dip)
// Inclined span: the parabola passes through both supports,
//   y(x) = w/(2T) * (x - a)^2 + height1 - w/(2T) * a^2
// so y(0) = height1 and y(S) = height2; dip is not used.
CatenaryCurve generate_curve(double weight, double span, double tension,
                             double dip, double height1,
                             std::optional<double> height2 = std::nullopt,
                             int num_samples = DEFAULT_CURVE_SAMPLES);

}  // namespace wiresag
