#ifndef DIFFGROWTH_SERIALIZATION_POINTS_JSON_HPP
#define DIFFGROWTH_SERIALIZATION_POINTS_JSON_HPP

#include <nlohmann/json.hpp>
#include "config_json.hpp"
#include <stdexcept>
#include <vector>

namespace diffgrowth {

// A closed polyline as an array of [x, y] pairs in curve order
inline nlohmann::json points_to_json(const std::vector<Vec2>& points) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& p : points) {
        j.push_back(p);
    }
    return j;
}

inline std::vector<Vec2> points_from_json(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw std::runtime_error("Expected an array of [x, y] points");
    }
    std::vector<Vec2> points;
    points.reserve(j.size());
    for (const auto& p : j) {
        points.push_back(p.get<Vec2>());
    }
    return points;
}

}  // namespace diffgrowth

#endif // DIFFGROWTH_SERIALIZATION_POINTS_JSON_HPP
