#ifndef DIFFGROWTH_GROWTH_RUN_CONFIG_HPP
#define DIFFGROWTH_GROWTH_RUN_CONFIG_HPP

#include "growth_config.hpp"
#include <generators/point_generators.hpp>
#include <cstddef>

namespace diffgrowth {

// Parameters, seed circle and iteration budget for one batch run
struct RunConfig {
    GrowthConfig growth;
    CircleSeed seed;              // Used when no starting points file is given
    int iterations = 500;
    size_t max_nodes = 0;         // Stop once the curve has this many nodes (0 = no limit)
};

}  // namespace diffgrowth

#endif // DIFFGROWTH_GROWTH_RUN_CONFIG_HPP
