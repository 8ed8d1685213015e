#include "point_generators.hpp"
#include <cmath>
#include <numbers>

namespace diffgrowth {

std::vector<Vec2> generate_points_on_circle(double center_x,
                                            double center_y,
                                            double radius,
                                            size_t count) {
    std::vector<Vec2> points;
    if (count == 0) {
        return points;
    }
    points.reserve(count);

    const double step = 2.0 * std::numbers::pi / static_cast<double>(count);

    // Angle from the index rather than an accumulated sum, so rounding
    // cannot add an extra point near 2*pi
    for (size_t i = 0; i < count; ++i) {
        double theta = step * static_cast<double>(i);
        points.emplace_back(center_x + radius * std::cos(theta),
                            center_y + radius * std::sin(theta));
    }

    return points;
}

}  // namespace diffgrowth
