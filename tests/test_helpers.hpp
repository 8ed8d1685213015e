#ifndef DIFFGROWTH_TEST_HELPERS_HPP
#define DIFFGROWTH_TEST_HELPERS_HPP

#include <math/vec2.hpp>
#include <growth/node.hpp>
#include <growth/growth_config.hpp>
#include <vector>

namespace diffgrowth {
namespace test {

// Axis-aligned square with its lower left corner at the origin,
// counter-clockwise
inline std::vector<Vec2> square(double side) {
    return {
        Vec2(0.0, 0.0),
        Vec2(side, 0.0),
        Vec2(side, side),
        Vec2(0.0, side)
    };
}

inline std::vector<Node> make_nodes(const std::vector<Vec2>& points,
                                    const GrowthConfig& config) {
    std::vector<Node> nodes;
    for (const auto& p : points) {
        nodes.emplace_back(p, config.max_speed, config.max_force);
    }
    return nodes;
}

inline bool all_finite(const std::vector<Vec2>& points) {
    for (const auto& p : points) {
        if (!p.is_finite()) {
            return false;
        }
    }
    return true;
}

// Parameters the library ships with as defaults
inline GrowthConfig default_config() {
    return GrowthConfig{};
}

}  // namespace test
}  // namespace diffgrowth

#endif // DIFFGROWTH_TEST_HELPERS_HPP
