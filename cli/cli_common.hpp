#ifndef DIFFGROWTH_CLI_CLI_COMMON_HPP
#define DIFFGROWTH_CLI_CLI_COMMON_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace diffgrowth::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;

    // Overrides for values normally taken from the config file
    std::optional<int> iterations;
    std::optional<size_t> max_nodes;
    std::optional<size_t> count;
    std::optional<double> radius;
};

inline int parse_int_arg(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        int result = std::stoi(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::logic_error&) {
        throw std::runtime_error(flag + " expects an integer, got: " + value);
    }
}

inline double parse_double_arg(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        double result = std::stod(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::logic_error&) {
        throw std::runtime_error(flag + " expects a number, got: " + value);
    }
}

inline size_t parse_count_arg(const std::string& flag, const std::string& value) {
    int result = parse_int_arg(flag, value);
    if (result < 0) {
        throw std::runtime_error(flag + " must not be negative, got: " + value);
    }
    return static_cast<size_t>(result);
}

// Parse command line arguments starting at start_idx
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    auto next_value = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(flag + " requires an argument");
        }
        std::string value = argv[i + 1];
        i += 2;
        return value;
    };

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = next_value(arg);
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = next_value(arg);
        } else if (arg == "--iterations") {
            ctx.iterations = parse_int_arg(arg, next_value(arg));
        } else if (arg == "--max-nodes") {
            ctx.max_nodes = parse_count_arg(arg, next_value(arg));
        } else if (arg == "--count") {
            ctx.count = parse_count_arg(arg, next_value(arg));
        } else if (arg == "--radius") {
            ctx.radius = parse_double_arg(arg, next_value(arg));
        } else if (arg == "-h" || arg == "--help") {
            // Handled by caller
            ++i;
        } else if (!arg.empty() && arg[0] != '-') {
            // Positional argument (input file)
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return {ctx, i};
}

// Command function declarations
int command_grow(int argc, char** argv);
int command_circle(int argc, char** argv);

}  // namespace diffgrowth::cli

#endif // DIFFGROWTH_CLI_CLI_COMMON_HPP
