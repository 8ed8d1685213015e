#ifndef DIFFGROWTH_GROWTH_DIFFERENTIAL_GROWTH_HPP
#define DIFFGROWTH_GROWTH_DIFFERENTIAL_GROWTH_HPP

#include "node.hpp"
#include "growth_config.hpp"
#include <functional>
#include <vector>

namespace diffgrowth {

class DifferentialGrowth;

// Callback after each tick of run() - returns true to continue, false to stop
// Called with (simulation, iteration_number)
using GrowthStepCallback = std::function<bool(const DifferentialGrowth&, int)>;

// Result of run()
struct GrowthResult {
    int iterations = 0;
    size_t initial_node_count = 0;
    size_t final_node_count = 0;
    bool stopped_early = false;
};

// Differential growth on a single closed curve.
//
// The nodes form a cycle in sequence order: node i connects to node i+1 and
// the last node connects back to the first. Each tick repels nearby nodes,
// pulls every node toward the midpoint of its two curve neighbors, integrates,
// and then splits every edge longer than max_edge_length at its midpoint.
// The node count never decreases and the cyclic order of existing nodes is
// never changed.
class DifferentialGrowth {
public:
    DifferentialGrowth(const std::vector<Vec2>& starting_points,
                       double max_force,
                       double max_speed,
                       double desired_separation,
                       double separation_cohesion_ratio,
                       double max_edge_length);

    DifferentialGrowth(const std::vector<Vec2>& starting_points,
                       const GrowthConfig& config);

    // Advance one iteration: differentiate() then grow()
    void tick();

    // Run up to `iterations` ticks, stopping early if the callback says so
    GrowthResult run(int iterations, const GrowthStepCallback& callback = nullptr);

    // Current positions in curve order
    std::vector<Vec2> get_points() const;

    // Compute separation and cohesion for every node from the current
    // positions, then apply them and integrate every node
    void differentiate();

    // Split every edge longer than max_edge_length once at its midpoint.
    // Returns the number of nodes inserted.
    size_t grow();

    const std::vector<Node>& nodes() const { return nodes_; }
    const Node& node(size_t index) const;
    size_t node_count() const { return nodes_.size(); }
    const GrowthConfig& config() const { return config_; }
    int iteration() const { return iteration_; }

private:
    std::vector<Node> nodes_;
    GrowthConfig config_;
    int iteration_ = 0;
};

}  // namespace diffgrowth

#endif // DIFFGROWTH_GROWTH_DIFFERENTIAL_GROWTH_HPP
