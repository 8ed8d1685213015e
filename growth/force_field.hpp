#ifndef DIFFGROWTH_GROWTH_FORCE_FIELD_HPP
#define DIFFGROWTH_GROWTH_FORCE_FIELD_HPP

#include "node.hpp"
#include "spatial_index.hpp"
#include "growth_config.hpp"
#include <vector>

namespace diffgrowth {

// Repulsion of `node` away from `neighbor`: normalize(p_node - p_neighbor) / distance.
// Zero when the two positions coincide.
Vec2 compute_separation_force(const Node& node, const Node& neighbor);

// Separation steering force for every node, using `index` (built from the
// same node positions) for the neighbor search within desired_separation.
// The repulsion is averaged over every point found, the node itself included.
// Each result is capped to max_force. Throws std::invalid_argument if the
// index does not hold one point per node.
std::vector<Vec2> compute_separation_forces(const std::vector<Node>& nodes,
                                            const SpatialIndex& index,
                                            const GrowthConfig& config);

// Cohesion steering force for every node: seek toward the midpoint of its
// previous and next neighbor along the closed curve.
std::vector<Vec2> compute_cohesion_forces(const std::vector<Node>& nodes);

}  // namespace diffgrowth

#endif // DIFFGROWTH_GROWTH_FORCE_FIELD_HPP
