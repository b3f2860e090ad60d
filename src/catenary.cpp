#include "wiresag/catenary.hpp"

namespace wiresag {

int CatenaryCurve::lowest_sample() const {
    if (y.size() == 0) return -1;
    Eigen::Index idx = 0;
    y.minCoeff(&idx);
    return static_cast<int>(idx);
}

double apex_offset(double weight, double span, double tension,
                   std::optional<double> height_difference) {
    require_positive(weight, "Unit weight must be positive");
    require_positive(span, "Span must be positive");
    require_positive(tension, "Tension must be positive");
    if (height_difference && !std::isfinite(*height_difference))
        throw std::invalid_argument("Height difference must be finite");

    if (!height_difference) return span / 2.0;
    return span / 2.0 - tension * (*height_difference) / (weight * span);
}

CatenaryCurve generate_curve(double weight, double span, double tension,
                             double dip, double height1,
                             std::optional<double> height2,
                             int num_samples) {
    if (num_samples < 2)
        throw std::invalid_argument("Curve needs at least 2 samples");
    if (!std::isfinite(height1) || (height2 && !std::isfinite(*height2)))
        throw std::invalid_argument("Support heights must be finite");

    std::optional<double> dh;
    if (height2) dh = *height2 - height1;

    CatenaryCurve curve;
    curve.apex_offset = apex_offset(weight, span, tension, dh);

    const double k = weight / (2.0 * tension);
    if (height2) {
        curve.apex_height = height1 - k * curve.apex_offset * curve.apex_offset;
    } else {
        require_positive(dip, "Dip must be positive");
        curve.apex_height = height1 - dip;
    }

    curve.x = Eigen::VectorXd::LinSpaced(num_samples, 0.0, span);
    curve.x(num_samples - 1) = span;

    curve.y.resize(num_samples);
    for (int i = 0; i < num_samples; i++) {
        double u = curve.x(i) - curve.apex_offset;
        curve.y(i) = k * u * u + curve.apex_height;
    }
    return curve;
}

}  // namespace wiresag
