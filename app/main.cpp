#include <iostream>
#include <string>

#include <cli/cli_common.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Grows a closed curve by differential growth.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  grow      Run the simulation and write the final curve as JSON\n";
    std::cerr << "  circle    Write starting points on a circle as JSON\n";
    std::cerr << "\n";
    std::cerr << "Run '" << program_name << " <command>' without arguments for command options.\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  DIFFGROWTH_LOG_LEVEL - Set log level (trace, debug, info, warn, error, critical, off)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "grow") {
        return diffgrowth::cli::command_grow(argc, argv);
    }
    if (command == "circle") {
        return diffgrowth::cli::command_circle(argc, argv);
    }
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
