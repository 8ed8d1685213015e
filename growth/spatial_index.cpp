#include "spatial_index.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace diffgrowth {

SpatialIndex::SpatialIndex(std::vector<Vec2> positions)
    : positions_(std::move(positions)), order_(positions_.size()) {
    std::iota(order_.begin(), order_.end(), size_t{0});
    build(0, order_.size(), 0);
}

const Vec2& SpatialIndex::position(size_t index) const {
    if (index >= positions_.size()) {
        throw std::out_of_range("SpatialIndex::position: invalid index");
    }
    return positions_[index];
}

void SpatialIndex::build(size_t begin, size_t end, int depth) {
    if (end - begin <= 1) {
        return;
    }

    const size_t axis = static_cast<size_t>(depth % 2);
    const size_t mid = begin + (end - begin) / 2;

    // Ties are broken on index so the layout depends only on the input
    std::nth_element(order_.begin() + begin, order_.begin() + mid, order_.begin() + end,
                     [this, axis](size_t a, size_t b) {
                         double va = positions_[a][axis];
                         double vb = positions_[b][axis];
                         if (va != vb) return va < vb;
                         return a < b;
                     });

    build(begin, mid, depth + 1);
    build(mid + 1, end, depth + 1);
}

std::vector<size_t> SpatialIndex::within_radius(const Vec2& center, double radius) const {
    std::vector<size_t> result;
    if (positions_.empty() || radius < 0.0) {
        return result;
    }

    query(0, order_.size(), 0, center, radius * radius, result);
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<size_t> SpatialIndex::within_radius(size_t index, double radius) const {
    return within_radius(position(index), radius);
}

void SpatialIndex::query(size_t begin, size_t end, int depth,
                         const Vec2& center, double radius_sq,
                         std::vector<size_t>& out) const {
    if (begin >= end) {
        return;
    }

    const size_t axis = static_cast<size_t>(depth % 2);
    const size_t mid = begin + (end - begin) / 2;
    const size_t point_index = order_[mid];
    const Vec2& point = positions_[point_index];

    Vec2 delta = point - center;
    if (delta.length_squared() <= radius_sq) {
        out.push_back(point_index);
    }

    // Signed distance from the splitting line; the far side is only
    // visited when the query circle crosses it
    double split_delta = center[axis] - point[axis];
    bool go_left_first = split_delta <= 0.0;
    bool cross = split_delta * split_delta <= radius_sq;

    if (go_left_first) {
        query(begin, mid, depth + 1, center, radius_sq, out);
        if (cross) {
            query(mid + 1, end, depth + 1, center, radius_sq, out);
        }
    } else {
        query(mid + 1, end, depth + 1, center, radius_sq, out);
        if (cross) {
            query(begin, mid, depth + 1, center, radius_sq, out);
        }
    }
}

}  // namespace diffgrowth
