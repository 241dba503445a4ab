#pragma once

#include <string>

namespace arbor::core {

// Hard ceiling for offline catch-up (24 hours)
constexpr double MAX_OFFLINE_SECONDS = 86400.0;

struct SimulationSettings {
    // Active difficulty tier id ("explore", "normal", "hard", "brutal", "ultra-brutal")
    std::string difficulty = "normal";

    // Tick length used when stepping the simulation at a fixed rate
    double fixed_timestep = 1.0 / 60.0;

    // Offline catch-up cap; may tighten MAX_OFFLINE_SECONDS, never loosen it
    double offline_cap_seconds = MAX_OFFLINE_SECONDS;

    // Species catalog JSON; empty = built-in catalog
    std::string species_catalog;

    std::string log_level = "info";

    // Singleton access
    static SimulationSettings& get();

    // Load settings from JSON file. Missing keys keep their current values.
    bool load(const std::string& path);
    bool load_from_string(const std::string& content);

    // Save settings to JSON file
    bool save(const std::string& path) const;
    std::string to_json_string() const;

    // Reset to defaults
    void reset();

    // offline_cap_seconds clamped into [0, MAX_OFFLINE_SECONDS]
    double effective_offline_cap() const;
};

} // namespace arbor::core
