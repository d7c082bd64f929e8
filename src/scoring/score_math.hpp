#ifndef SCORE_MATH_HPP
#define SCORE_MATH_HPP

#include <algorithm>
#include <cmath>

namespace engagement {

inline double clampUnit(double value) {
    return std::max(0.0, std::min(value, 1.0));
}

// Half away from zero.
inline double roundTo(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

} // namespace engagement

#endif // SCORE_MATH_HPP
