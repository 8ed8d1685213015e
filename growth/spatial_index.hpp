#ifndef DIFFGROWTH_GROWTH_SPATIAL_INDEX_HPP
#define DIFFGROWTH_GROWTH_SPATIAL_INDEX_HPP

#include <math/vec2.hpp>
#include <cstddef>
#include <vector>

namespace diffgrowth {

// Balanced 2D k-d tree over a snapshot of node positions.
//
// The tree is implicit: order_ holds point indices arranged so that for any
// range [begin, end) the median element at (begin + end) / 2 splits the
// remaining points on the axis for that depth (x at even depths, y at odd).
// There are no per-node allocations; building is O(n log n) via nth_element.
//
// Positions are copied at construction, so later mutation of the nodes does
// not affect queries against this index. Built fresh once per tick.
class SpatialIndex {
public:
    SpatialIndex() = default;
    explicit SpatialIndex(std::vector<Vec2> positions);

    // Indices of all points with distance <= radius from center,
    // in ascending index order
    std::vector<size_t> within_radius(const Vec2& center, double radius) const;

    // Same query centered on an indexed point (the point itself is included)
    std::vector<size_t> within_radius(size_t index, double radius) const;

    size_t size() const { return positions_.size(); }
    bool empty() const { return positions_.empty(); }
    const Vec2& position(size_t index) const;

private:
    void build(size_t begin, size_t end, int depth);
    void query(size_t begin, size_t end, int depth,
               const Vec2& center, double radius_sq,
               std::vector<size_t>& out) const;

    std::vector<Vec2> positions_;
    std::vector<size_t> order_;
};

}  // namespace diffgrowth

#endif // DIFFGROWTH_GROWTH_SPATIAL_INDEX_HPP
