#include "force_field.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace diffgrowth {

Vec2 compute_separation_force(const Node& node, const Node& neighbor) {
    // Defer the sqrt until we know the points are apart
    Vec2 diff = node.position - neighbor.position;
    double distance_sq = diff.length_squared();

    if (distance_sq > 0.0) {
        return diff.normalized() / std::sqrt(distance_sq);
    }
    return vec2::zero();
}

std::vector<Vec2> compute_separation_forces(const std::vector<Node>& nodes,
                                            const SpatialIndex& index,
                                            const GrowthConfig& config) {
    if (index.size() != nodes.size()) {
        throw std::invalid_argument("compute_separation_forces: index holds " +
                                    std::to_string(index.size()) + " points for " +
                                    std::to_string(nodes.size()) + " nodes");
    }

    std::vector<Vec2> forces(nodes.size(), vec2::zero());

    for (size_t i = 0; i < nodes.size(); ++i) {
        const Node& node = nodes[i];

        // No repulsion can act outside desired_separation
        std::vector<size_t> close = index.within_radius(i, config.desired_separation);

        // The node itself and coincident neighbors add nothing but still
        // count toward the average
        Vec2 steer;
        for (size_t j : close) {
            if (j != i) {
                steer += compute_separation_force(node, nodes[j]);
            }
        }

        if (!close.empty()) {
            steer /= static_cast<double>(close.size());
        }

        steer = steer.with_length(config.max_speed);

        // Rescaling a degenerate sum can leave non-finite components
        if (!std::isfinite(steer.x)) steer.x = 0.0;
        if (!std::isfinite(steer.y)) steer.y = 0.0;

        steer -= node.velocity;
        forces[i] = steer.capped(config.max_force);
    }

    return forces;
}

std::vector<Vec2> compute_cohesion_forces(const std::vector<Node>& nodes) {
    const size_t n = nodes.size();
    std::vector<Vec2> forces;
    forces.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        // Explicit wraparound at both ends of the sequence
        size_t prev = (i == 0) ? n - 1 : i - 1;
        size_t next = (i == n - 1) ? 0 : i + 1;

        Vec2 target = midpoint(nodes[prev].position, nodes[next].position);
        forces.push_back(nodes[i].seek(target));
    }

    return forces;
}

}  // namespace diffgrowth
