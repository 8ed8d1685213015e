#include "differential_growth.hpp"
#include "force_field.hpp"
#include "spatial_index.hpp"
#include <common/logging.hpp>
#include <stdexcept>

namespace diffgrowth {

DifferentialGrowth::DifferentialGrowth(const std::vector<Vec2>& starting_points,
                                       double max_force,
                                       double max_speed,
                                       double desired_separation,
                                       double separation_cohesion_ratio,
                                       double max_edge_length)
    : DifferentialGrowth(starting_points,
                         GrowthConfig{max_force, max_speed, desired_separation,
                                      separation_cohesion_ratio, max_edge_length}) {}

DifferentialGrowth::DifferentialGrowth(const std::vector<Vec2>& starting_points,
                                       const GrowthConfig& config)
    : config_(config) {
    auto log = diffgrowth::logging::get_logger();

    nodes_.reserve(starting_points.size());
    for (const Vec2& point : starting_points) {
        nodes_.emplace_back(point, config_.max_speed, config_.max_force);
    }

    if (nodes_.size() < 2) {
        log->warn("DifferentialGrowth: {} starting point(s), the curve cannot grow",
                  nodes_.size());
    }

    log->debug("DifferentialGrowth: {} nodes, max_force={}, max_speed={}, "
               "desired_separation={}, ratio={}, max_edge_length={}",
               nodes_.size(), config_.max_force, config_.max_speed,
               config_.desired_separation, config_.separation_cohesion_ratio,
               config_.max_edge_length);
}

const Node& DifferentialGrowth::node(size_t index) const {
    if (index >= nodes_.size()) {
        throw std::out_of_range("DifferentialGrowth::node: invalid node index");
    }
    return nodes_[index];
}

void DifferentialGrowth::tick() {
    differentiate();
    size_t inserted = grow();
    ++iteration_;

    auto log = diffgrowth::logging::get_logger();
    log->trace("DifferentialGrowth: tick {} inserted {} nodes, total {}",
               iteration_, inserted, nodes_.size());
}

GrowthResult DifferentialGrowth::run(int iterations, const GrowthStepCallback& callback) {
    auto log = diffgrowth::logging::get_logger();

    GrowthResult result;
    result.initial_node_count = nodes_.size();

    log->info("DifferentialGrowth: running {} iterations from {} nodes",
              iterations, nodes_.size());

    for (int iter = 0; iter < iterations; ++iter) {
        tick();
        result.iterations = iter + 1;

        // Log progress periodically
        if ((iter + 1) % 100 == 0) {
            log->debug("DifferentialGrowth: iteration {}, {} nodes", iter + 1, nodes_.size());
        }

        if (callback && !callback(*this, iter + 1)) {
            result.stopped_early = (iter + 1 < iterations);
            break;
        }
    }

    result.final_node_count = nodes_.size();
    log->info("DifferentialGrowth: {} iterations complete, {} -> {} nodes",
              result.iterations, result.initial_node_count, result.final_node_count);

    return result;
}

std::vector<Vec2> DifferentialGrowth::get_points() const {
    std::vector<Vec2> points;
    points.reserve(nodes_.size());
    for (const auto& node : nodes_) {
        points.push_back(node.position);
    }
    return points;
}

void DifferentialGrowth::differentiate() {
    if (nodes_.empty()) {
        return;
    }

    // Every force is computed from the same pre-tick snapshot before any
    // node moves; the index copies the positions it is built from
    SpatialIndex index(get_points());
    std::vector<Vec2> separation_forces = compute_separation_forces(nodes_, index, config_);
    std::vector<Vec2> cohesion_forces = compute_cohesion_forces(nodes_);

    for (size_t i = 0; i < nodes_.size(); ++i) {
        Vec2 separation = separation_forces[i] * config_.separation_cohesion_ratio;

        nodes_[i].apply_force(separation);
        nodes_[i].apply_force(cohesion_forces[i]);
        nodes_[i].update();
    }
}

size_t DifferentialGrowth::grow() {
    const size_t n = nodes_.size();
    if (n < 2) {
        return 0;
    }

    // Scan the post-integration cycle first, recording at most one split per
    // edge; the scan never sees its own insertions
    std::vector<bool> split(n, false);
    size_t pending = 0;
    for (size_t i = 0; i < n; ++i) {
        const Node& a = nodes_[i];
        const Node& b = nodes_[(i == n - 1) ? 0 : i + 1];
        if (a.position.distance_to(b.position) > config_.max_edge_length) {
            split[i] = true;
            ++pending;
        }
    }

    if (pending == 0) {
        return 0;
    }

    // Assemble the grown cycle separately and swap it in, so an allocation
    // failure leaves the current cycle intact. The k-th split (counting
    // from 0) lands at index i + 1 + k.
    std::vector<Node> grown;
    grown.reserve(n + pending);
    for (size_t i = 0; i < n; ++i) {
        grown.push_back(nodes_[i]);
        if (split[i]) {
            const Node& next = nodes_[(i == n - 1) ? 0 : i + 1];
            grown.emplace_back(midpoint(nodes_[i].position, next.position),
                               config_.max_speed, config_.max_force);
        }
    }

    nodes_.swap(grown);
    return pending;
}

}  // namespace diffgrowth
