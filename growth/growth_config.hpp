#ifndef DIFFGROWTH_GROWTH_GROWTH_CONFIG_HPP
#define DIFFGROWTH_GROWTH_GROWTH_CONFIG_HPP

namespace diffgrowth {

// Parameters of a differential growth simulation.
// Fixed for the lifetime of a simulation; copied into every node it creates.
struct GrowthConfig {
    double max_force = 1.5;                  // Cap on any steering force
    double max_speed = 1.0;                  // Cap on node velocity
    double desired_separation = 14.0;        // No repulsion acts beyond this radius
    double separation_cohesion_ratio = 1.1;  // Weight of separation relative to cohesion
    double max_edge_length = 5.0;            // Edges longer than this are split
};

}  // namespace diffgrowth

#endif // DIFFGROWTH_GROWTH_GROWTH_CONFIG_HPP
