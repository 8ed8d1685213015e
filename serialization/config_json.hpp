#ifndef DIFFGROWTH_SERIALIZATION_CONFIG_JSON_HPP
#define DIFFGROWTH_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec2.hpp>
#include <growth/growth_config.hpp>
#include <growth/differential_growth.hpp>
#include <generators/point_generators.hpp>
#include <growth/run_config.hpp>
#include <cmath>
#include <stdexcept>
#include <string>

namespace diffgrowth {

// Vec2 serialization
inline void to_json(nlohmann::json& j, const Vec2& v) {
    j = nlohmann::json::array({v.x, v.y});
}

inline void from_json(const nlohmann::json& j, Vec2& v) {
    if (!j.is_array() || j.size() != 2) {
        throw std::runtime_error("Point must be an [x, y] array, got: " + j.dump());
    }
    v.x = j[0].get<double>();
    v.y = j[1].get<double>();
}

// GrowthConfig serialization
inline void to_json(nlohmann::json& j, const GrowthConfig& config) {
    j = {
        {"max_force", config.max_force},
        {"max_speed", config.max_speed},
        {"desired_separation", config.desired_separation},
        {"separation_cohesion_ratio", config.separation_cohesion_ratio},
        {"max_edge_length", config.max_edge_length}
    };
}

inline void from_json(const nlohmann::json& j, GrowthConfig& config) {
    config.max_force = j.value("max_force", 1.5);
    config.max_speed = j.value("max_speed", 1.0);
    config.desired_separation = j.value("desired_separation", 14.0);
    config.separation_cohesion_ratio = j.value("separation_cohesion_ratio", 1.1);
    config.max_edge_length = j.value("max_edge_length", 5.0);
}

// Reject parameters the simulation cannot run with.
// The simulation itself assumes valid input; this guards the file boundary.
inline void validate(const GrowthConfig& config) {
    auto check = [](const char* name, double value) {
        if (!std::isfinite(value) || value <= 0.0) {
            throw std::invalid_argument(std::string("Growth parameter ") + name +
                                        " must be positive and finite, got " +
                                        std::to_string(value));
        }
    };
    check("max_force", config.max_force);
    check("max_speed", config.max_speed);
    check("desired_separation", config.desired_separation);
    check("separation_cohesion_ratio", config.separation_cohesion_ratio);
    check("max_edge_length", config.max_edge_length);
}

// CircleSeed serialization
inline void to_json(nlohmann::json& j, const CircleSeed& seed) {
    j = {
        {"center", seed.center},
        {"radius", seed.radius},
        {"count", seed.count}
    };
}

inline void from_json(const nlohmann::json& j, CircleSeed& seed) {
    if (j.contains("center")) {
        seed.center = j["center"].get<Vec2>();
    }
    seed.radius = j.value("radius", 10.0);
    seed.count = j.value("count", size_t{10});
}

// RunConfig serialization
inline void to_json(nlohmann::json& j, const RunConfig& config) {
    j = {
        {"growth", config.growth},
        {"seed", config.seed},
        {"iterations", config.iterations},
        {"max_nodes", config.max_nodes}
    };
}

inline void from_json(const nlohmann::json& j, RunConfig& config) {
    if (j.contains("growth")) {
        config.growth = j["growth"].get<GrowthConfig>();
    }
    if (j.contains("seed")) {
        config.seed = j["seed"].get<CircleSeed>();
    }
    config.iterations = j.value("iterations", 500);
    config.max_nodes = j.value("max_nodes", size_t{0});
}

// GrowthResult serialization
inline void to_json(nlohmann::json& j, const GrowthResult& result) {
    j = {
        {"iterations", result.iterations},
        {"initial_node_count", result.initial_node_count},
        {"final_node_count", result.final_node_count},
        {"stopped_early", result.stopped_early}
    };
}

inline void from_json(const nlohmann::json& j, GrowthResult& result) {
    result.iterations = j.value("iterations", 0);
    result.initial_node_count = j.value("initial_node_count", size_t{0});
    result.final_node_count = j.value("final_node_count", size_t{0});
    result.stopped_early = j.value("stopped_early", false);
}

}  // namespace diffgrowth

#endif // DIFFGROWTH_SERIALIZATION_CONFIG_JSON_HPP
