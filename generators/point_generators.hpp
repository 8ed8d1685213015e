#ifndef DIFFGROWTH_GENERATORS_POINT_GENERATORS_HPP
#define DIFFGROWTH_GENERATORS_POINT_GENERATORS_HPP

#include <math/vec2.hpp>
#include <cstddef>
#include <vector>

namespace diffgrowth {

// Circle of starting points
struct CircleSeed {
    Vec2 center;
    double radius = 10.0;
    size_t count = 10;
};

// `count` points evenly spaced on a circle, starting at angle 0 and going
// counter-clockwise in steps of 2*pi / count. The full revolution is not
// repeated, so the first and last points are distinct.
std::vector<Vec2> generate_points_on_circle(double center_x,
                                            double center_y,
                                            double radius,
                                            size_t count);

inline std::vector<Vec2> generate_points_on_circle(const CircleSeed& seed) {
    return generate_points_on_circle(seed.center.x, seed.center.y, seed.radius, seed.count);
}

}  // namespace diffgrowth

#endif // DIFFGROWTH_GENERATORS_POINT_GENERATORS_HPP
