#include "cli_common.hpp"
#include <growth/run_config.hpp>
#include <generators/point_generators.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/points_json.hpp>
#include <common/logging.hpp>
#include <iostream>

namespace diffgrowth::cli {

int command_circle(int argc, char** argv) {
    auto log = diffgrowth::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.output_path.empty()) {
            std::cerr << "Usage: diffgrowth circle -o <points.json> [options]\n";
            std::cerr << "Options:\n";
            std::cerr << "  -c, --config FILE    Read the seed circle from a run configuration\n";
            std::cerr << "  --count N            Number of points (default: 10)\n";
            std::cerr << "  --radius R           Circle radius (default: 10)\n";
            return 1;
        }

        CircleSeed seed;
        if (ctx.config_path.has_value()) {
            seed = json::read_json_file(ctx.config_path.value()).get<RunConfig>().seed;
        }
        if (ctx.count.has_value()) {
            seed.count = ctx.count.value();
        }
        if (ctx.radius.has_value()) {
            seed.radius = ctx.radius.value();
        }

        std::vector<Vec2> points = generate_points_on_circle(seed);
        log->debug("Generated {} points on a circle of radius {}", points.size(), seed.radius);

        json::SerializedData data;
        data.step = "starting_points";
        data.timestamp = json::get_timestamp();
        data.config = {{"seed", seed}};
        data.data = points_to_json(points);
        data.stats = {{"point_count", points.size()}};

        json::write_serialized(ctx.output_path, data);

        std::cerr << "Wrote " << ctx.output_path << " (" << points.size() << " points)\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace diffgrowth::cli
