#pragma once

#include <string>

namespace arbor::cli {

// Command result codes
enum class Result {
    Success = 0,
    InvalidArgs = 1,
    FileError = 2
};

// Flags shared by every command
struct GlobalOptions {
    std::string settings_path;      // --settings <file>
    std::string catalog_path;       // --catalog <file>, overrides the settings entry
};

struct SimulateOptions {
    std::string species_id;
    double seconds = 0.0;
    double dt = 0.0;                // 0 = settings fixed_timestep
    std::string season = "summer";
    std::string weather = "clear";
};

struct OfflineOptions {
    std::string species_id;
    double seconds = 0.0;
    int stage = 0;
    double progress = 0.0;
};

// Load settings and the species catalog named by the global flags
Result load_environment(const GlobalOptions& options);

// arbor-cli species
// Lists the species catalog
Result cmd_species();

// arbor-cli simulate <species> --seconds N [--dt D] [--season S] [--weather W]
// Ticks a single planted tree and reports where it ended up
Result cmd_simulate(const SimulateOptions& options);

// arbor-cli offline <species> --seconds N [--stage S] [--progress P]
// Runs one offline catch-up
Result cmd_offline(const OfflineOptions& options);

// arbor-cli help
void cmd_help();

// Strict number parsing; false if `text` is not entirely a number
bool parse_double(const std::string& text, double& out);
bool parse_int(const std::string& text, int& out);

} // namespace arbor::cli
