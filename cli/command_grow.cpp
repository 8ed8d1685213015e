#include "cli_common.hpp"
#include <growth/run_config.hpp>
#include <growth/differential_growth.hpp>
#include <generators/point_generators.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/points_json.hpp>
#include <common/logging.hpp>
#include <iostream>

namespace diffgrowth::cli {

namespace {

void print_grow_usage() {
    std::cerr << "Usage: diffgrowth grow [points.json] -o <curve.json> [options]\n";
    std::cerr << "Options:\n";
    std::cerr << "  -c, --config FILE    Run configuration (growth parameters, seed, iterations)\n";
    std::cerr << "  --iterations N       Number of ticks (default: from config or 500)\n";
    std::cerr << "  --max-nodes N        Stop once the curve reaches N nodes (0 = no limit)\n";
    std::cerr << "  --count N            Points on the starting circle\n";
    std::cerr << "  --radius R           Radius of the starting circle\n";
    std::cerr << "  -v, --verbose        Debug logging\n";
    std::cerr << "\n";
    std::cerr << "Starting points are read from points.json (an array of [x, y] pairs or the\n";
    std::cerr << "output of 'diffgrowth circle') when given, otherwise generated on a circle.\n";
}

std::vector<Vec2> load_starting_points(const std::string& path) {
    nlohmann::json j = json::read_json_file(path);
    if (j.is_object()) {
        return points_from_json(json::SerializedData::from_json(j).data);
    }
    return points_from_json(j);
}

}  // namespace

int command_grow(int argc, char** argv) {
    auto log = diffgrowth::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.output_path.empty()) {
            print_grow_usage();
            std::cerr << "Error: -o <output> is required\n";
            return 1;
        }

        if (ctx.verbose) {
            log->set_level(spdlog::level::debug);
        }

        RunConfig run_config;
        if (ctx.config_path.has_value()) {
            run_config = json::read_json_file(ctx.config_path.value()).get<RunConfig>();
            log->info("Using configuration from {}", ctx.config_path.value());
        }

        // Override with command-line arguments
        if (ctx.iterations.has_value()) {
            run_config.iterations = ctx.iterations.value();
        }
        if (ctx.max_nodes.has_value()) {
            run_config.max_nodes = ctx.max_nodes.value();
        }
        if (ctx.count.has_value()) {
            run_config.seed.count = ctx.count.value();
        }
        if (ctx.radius.has_value()) {
            run_config.seed.radius = ctx.radius.value();
        }

        validate(run_config.growth);
        if (run_config.iterations < 0) {
            throw std::invalid_argument("iterations must not be negative");
        }

        std::vector<Vec2> starting_points;
        if (!ctx.input_path.empty()) {
            log->info("Reading starting points from {}", ctx.input_path);
            starting_points = load_starting_points(ctx.input_path);
        } else {
            log->debug("Generating {} starting points on a circle of radius {}",
                       run_config.seed.count, run_config.seed.radius);
            starting_points = generate_points_on_circle(run_config.seed);
        }

        DifferentialGrowth simulation(starting_points, run_config.growth);

        GrowthStepCallback stop_at_limit = nullptr;
        if (run_config.max_nodes > 0) {
            size_t limit = run_config.max_nodes;
            stop_at_limit = [limit](const DifferentialGrowth& sim, int) {
                return sim.node_count() < limit;
            };
        }

        GrowthResult result = simulation.run(run_config.iterations, stop_at_limit);
        if (result.stopped_early) {
            log->info("Stopped after {} iterations: node limit {} reached",
                      result.iterations, run_config.max_nodes);
        }

        json::SerializedData data;
        data.step = "curve";
        data.timestamp = json::get_timestamp();
        data.config = {
            {"run", run_config},
            {"result", result}
        };
        data.data = points_to_json(simulation.get_points());
        data.stats = {
            {"node_count", simulation.node_count()},
            {"iterations", result.iterations}
        };

        json::write_serialized(ctx.output_path, data);

        log->info("Wrote curve to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << simulation.node_count() << " nodes after "
                  << result.iterations << " iterations)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace diffgrowth::cli
