#include "commands.hpp"
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

using namespace arbor::cli;

void print_version() {
    std::cout << "Arbor CLI v0.1.0\n";
}

namespace {

// Splits out --settings/--catalog; everything else is returned in order.
// Returns false if a global flag is missing its value.
bool extract_global_options(int argc, char* argv[], GlobalOptions& globals,
                            std::vector<std::string>& rest) {
    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--settings") == 0 || std::strcmp(argv[i], "--catalog") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << argv[i] << " requires a file path\n";
                return false;
            }
            std::string& target = std::strcmp(argv[i], "--settings") == 0
                                      ? globals.settings_path : globals.catalog_path;
            target = argv[++i];
        } else {
            rest.emplace_back(argv[i]);
        }
    }
    return true;
}

bool require_value(const std::vector<std::string>& args, size_t i) {
    if (i + 1 < args.size()) return true;
    std::cerr << "Error: " << args[i] << " requires a value\n";
    return false;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        cmd_help();
        return static_cast<int>(Result::InvalidArgs);
    }

    std::string command = argv[1];

    if (command == "--version" || command == "-v") {
        print_version();
        return 0;
    }

    if (command == "help" || command == "--help" || command == "-h") {
        cmd_help();
        return 0;
    }

    GlobalOptions globals;
    std::vector<std::string> args;
    if (!extract_global_options(argc, argv, globals, args)) {
        return static_cast<int>(Result::InvalidArgs);
    }

    if (command != "species" && command != "simulate" && command != "offline") {
        std::cerr << "Unknown command: " << command << "\n";
        std::cerr << "Run 'arbor-cli help' for usage information.\n";
        return static_cast<int>(Result::InvalidArgs);
    }

    Result loaded = load_environment(globals);
    if (loaded != Result::Success) {
        return static_cast<int>(loaded);
    }

    if (command == "species") {
        return static_cast<int>(cmd_species());
    }

    if (args.empty() || args[0].rfind("--", 0) == 0) {
        std::cerr << "Error: 'arbor-cli " << command << "' requires a species id\n";
        return static_cast<int>(Result::InvalidArgs);
    }

    bool has_seconds = false;

    if (command == "simulate") {
        SimulateOptions options;
        options.species_id = args[0];

        for (size_t i = 1; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg == "--seconds" || arg == "--dt") {
                if (!require_value(args, i)) return static_cast<int>(Result::InvalidArgs);
                double& target = arg == "--seconds" ? options.seconds : options.dt;
                if (!parse_double(args[++i], target)) {
                    std::cerr << "Error: " << arg << " expects a number\n";
                    return static_cast<int>(Result::InvalidArgs);
                }
                if (arg == "--seconds") has_seconds = true;
            } else if (arg == "--season" || arg == "--weather") {
                if (!require_value(args, i)) return static_cast<int>(Result::InvalidArgs);
                (arg == "--season" ? options.season : options.weather) = args[++i];
            } else {
                std::cerr << "Error: unknown option " << arg << "\n";
                return static_cast<int>(Result::InvalidArgs);
            }
        }

        if (!has_seconds) {
            std::cerr << "Usage: arbor-cli simulate <species> --seconds <n> [--dt <s>] [--season <s>] [--weather <w>]\n";
            return static_cast<int>(Result::InvalidArgs);
        }
        return static_cast<int>(cmd_simulate(options));
    }

    OfflineOptions options;
    options.species_id = args[0];

    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--seconds" || arg == "--progress") {
            if (!require_value(args, i)) return static_cast<int>(Result::InvalidArgs);
            double& target = arg == "--seconds" ? options.seconds : options.progress;
            if (!parse_double(args[++i], target)) {
                std::cerr << "Error: " << arg << " expects a number\n";
                return static_cast<int>(Result::InvalidArgs);
            }
            if (arg == "--seconds") has_seconds = true;
        } else if (arg == "--stage") {
            if (!require_value(args, i)) return static_cast<int>(Result::InvalidArgs);
            if (!parse_int(args[++i], options.stage)) {
                std::cerr << "Error: --stage expects an integer\n";
                return static_cast<int>(Result::InvalidArgs);
            }
        } else {
            std::cerr << "Error: unknown option " << arg << "\n";
            return static_cast<int>(Result::InvalidArgs);
        }
    }

    if (!has_seconds) {
        std::cerr << "Usage: arbor-cli offline <species> --seconds <n> [--stage <s>] [--progress <p>]\n";
        return static_cast<int>(Result::InvalidArgs);
    }
    return static_cast<int>(cmd_offline(options));
}
