#include "node.hpp"
#include <spdlog/fmt/fmt.h>

namespace diffgrowth {

void Node::update() {
    velocity += acceleration;
    velocity = velocity.capped(max_speed);
    position += velocity;
    acceleration = vec2::zero();
}

Vec2 Node::seek(const Vec2& target) const {
    Vec2 desired = target - position;

    // Zero-length desired velocity has no direction to rescale
    if (desired.length_squared() != 0.0) {
        desired = desired.with_length(max_speed);
    }

    Vec2 steer = desired - velocity;
    return steer.capped(max_force);
}

std::string Node::to_string() const {
    return fmt::format("Node{{pos=({}, {}), vel=({}, {}), acc=({}, {})}}",
                       position.x, position.y,
                       velocity.x, velocity.y,
                       acceleration.x, acceleration.y);
}

}  // namespace diffgrowth
