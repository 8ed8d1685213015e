#ifndef DIFFGROWTH_GROWTH_NODE_HPP
#define DIFFGROWTH_GROWTH_NODE_HPP

#include <math/vec2.hpp>
#include <string>

namespace diffgrowth {

// A point mass on the growing curve.
// Knows nothing about its neighbors; topology lives in DifferentialGrowth.
struct Node {
    Vec2 position;
    Vec2 velocity;
    Vec2 acceleration;            // Accumulated forces, cleared by update()

    double max_force = 0.0;
    double max_speed = 0.0;

    Node() = default;
    Node(const Vec2& pos, double max_speed_, double max_force_)
        : position(pos), max_force(max_force_), max_speed(max_speed_) {}

    // Add a force to the accumulated acceleration (no limits applied)
    void apply_force(const Vec2& force) {
        acceleration += force;
    }

    // Integrate one step: velocity is capped to max_speed, acceleration reset
    void update();

    // Steering force toward target: (desired velocity - velocity), capped to max_force
    Vec2 seek(const Vec2& target) const;

    // Short diagnostic form for logging
    std::string to_string() const;
};

}  // namespace diffgrowth

#endif // DIFFGROWTH_GROWTH_NODE_HPP
