#include "commands.hpp"
#include <arbor/catalog/difficulty.hpp>
#include <arbor/catalog/species.hpp>
#include <arbor/core/filesystem.hpp>
#include <arbor/core/log.hpp>
#include <arbor/core/simulation_settings.hpp>
#include <arbor/environment/season.hpp>
#include <arbor/environment/weather.hpp>
#include <arbor/lifecycle/lifecycle_systems.hpp>
#include <arbor/lifecycle/offline_growth.hpp>
#include <arbor/lifecycle/tree_actions.hpp>
#include <arbor/scene/systems.hpp>
#include <arbor/scene/world.hpp>
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <format>
#include <iostream>
#include <limits>

namespace arbor::cli {

using core::log;
using core::LogLevel;
using core::SimulationSettings;

bool parse_double(const std::string& text, double& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size() || !std::isfinite(value)) return false;
    out = value;
    return true;
}

bool parse_int(const std::string& text, int& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size()) return false;
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) return false;
    out = static_cast<int>(value);
    return true;
}

Result load_environment(const GlobalOptions& options) {
    auto& settings = SimulationSettings::get();

    if (!options.settings_path.empty()) {
        if (!core::FileSystem::exists(options.settings_path)) {
            std::cerr << "Error: settings file not found: " << options.settings_path << "\n";
            return Result::FileError;
        }
        if (!settings.load(options.settings_path)) {
            std::cerr << "Error: could not load settings from " << options.settings_path << "\n";
            return Result::FileError;
        }
    }

    core::set_log_level(core::log_level_from_string(settings.log_level));

    if (!catalog::find_difficulty_tier(settings.difficulty)) {
        log(LogLevel::Warn, "Unknown difficulty '{}', using normal", settings.difficulty);
    }

    std::string catalog_path = options.catalog_path.empty() ? settings.species_catalog
                                                            : options.catalog_path;
    if (!catalog_path.empty()) {
        auto& species_catalog = catalog::get_species_catalog();
        species_catalog.clear();
        if (!species_catalog.load_json(catalog_path)) {
            std::cerr << "Error: could not load species catalog from " << catalog_path << "\n";
            return Result::FileError;
        }
    }

    return Result::Success;
}

Result cmd_species() {
    const auto& species_catalog = catalog::get_species_catalog();

    std::cout << std::format("{:<16} {:<18} {:>4} {:>6}  {:<9} {}\n",
                             "ID", "NAME", "DIFF", "CYCLE", "EVERGREEN", "YIELD");
    for (const auto& species : species_catalog.all()) {
        std::string yields;
        for (const auto& y : species.yields) {
            if (!yields.empty()) yields += ", ";
            yields += std::format("{} {}", y.amount, catalog::resource_type_to_string(y.type));
        }
        std::cout << std::format("{:<16} {:<18} {:>4} {:>5}s  {:<9} {}\n",
                                 species.id, species.name, species.difficulty,
                                 species.harvest_cycle_sec, species.evergreen ? "yes" : "no",
                                 yields);
    }
    std::cout << std::format("{} species\n", species_catalog.size());
    return Result::Success;
}

Result cmd_simulate(const SimulateOptions& options) {
    using namespace arbor::lifecycle;

    const auto& settings = SimulationSettings::get();
    const auto& species_catalog = catalog::get_species_catalog();

    if (!species_catalog.contains(options.species_id)) {
        std::cerr << "Error: unknown species '" << options.species_id << "'\n";
        return Result::InvalidArgs;
    }
    if (options.seconds < 0.0) {
        std::cerr << "Error: --seconds must not be negative\n";
        return Result::InvalidArgs;
    }

    double dt = options.dt > 0.0 ? options.dt : settings.fixed_timestep;

    LifecycleConditions conditions;
    conditions.difficulty = settings.difficulty;

    auto season = environment::season_from_string(options.season);
    if (!season) {
        log(LogLevel::Warn, "Unknown season '{}', treating it as summer", options.season);
    }
    conditions.season = season.value_or(environment::Season::Summer);

    auto weather = environment::weather_type_from_string(options.weather);
    if (!weather) {
        std::cerr << "Error: unknown weather '" << options.weather << "'\n";
        return Result::InvalidArgs;
    }
    conditions.weather = *weather;

    scene::World world;
    scene::Scheduler scheduler;
    register_lifecycle_systems(scheduler, conditions);

    spawn_grid_cell(world, {0, 0}, CellType::Soil);
    scene::Entity tree = plant_tree(world, options.species_id, {0, 0});
    if (tree == scene::NullEntity) {
        std::cerr << "Error: could not plant '" << options.species_id << "'\n";
        return Result::InvalidArgs;
    }

    double elapsed = 0.0;
    while (elapsed < options.seconds) {
        double step = std::min(dt, options.seconds - elapsed);
        scheduler.run(world, step, scene::Phase::FixedUpdate);
        elapsed += step;
    }

    const auto& component = world.get<TreeComponent>(tree);
    const auto* harvestable = world.try_get<Harvestable>(tree);

    std::cout << std::format("species:  {}\n", component.species_id);
    std::cout << std::format("elapsed:  {:.2f}s ({} {}, {})\n", elapsed,
                             environment::season_to_string(conditions.season),
                             environment::weather_type_to_string(conditions.weather),
                             settings.difficulty);
    std::cout << std::format("stage:    {} ({})\n", component.stage, tree_stage_name(component.stage));
    std::cout << std::format("progress: {:.4f}\n", component.progress);
    if (harvestable) {
        std::cout << std::format("harvest:  {} ({:.1f}/{:.1f}s)\n",
                                 harvestable->ready ? "ready" : "cooling down",
                                 harvestable->cooldown_elapsed, harvestable->cooldown_total);
    } else {
        std::cout << "harvest:  not mature\n";
    }
    return Result::Success;
}

Result cmd_offline(const OfflineOptions& options) {
    using namespace arbor::lifecycle;

    const auto& settings = SimulationSettings::get();
    const auto* species = catalog::get_species_catalog().find(options.species_id);
    if (!species) {
        std::cerr << "Error: unknown species '" << options.species_id << "'\n";
        return Result::InvalidArgs;
    }
    if (options.stage < TreeStage::Seed || options.stage > MAX_STAGE) {
        std::cerr << "Error: --stage must be between 0 and " << MAX_STAGE << "\n";
        return Result::InvalidArgs;
    }
    if (options.progress < 0.0 || options.progress >= 1.0) {
        std::cerr << "Error: --progress must be in [0, 1)\n";
        return Result::InvalidArgs;
    }

    OfflineTreeState state;
    state.species_id = options.species_id;
    state.stage = options.stage;
    state.progress = options.progress;

    OfflineGrowthOptions growth_options;
    growth_options.growth_scalar = catalog::difficulty_tier_or_normal(settings.difficulty).growth_speed_mult;
    growth_options.cap_seconds = settings.effective_offline_cap();

    OfflineGrowthResult result = calculate_offline_growth(state, options.seconds, *species, growth_options);

    std::cout << std::format("species:  {}\n", options.species_id);
    std::cout << std::format("elapsed:  {:.0f}s (cap {:.0f}s, {})\n", options.seconds,
                             growth_options.cap_seconds, settings.difficulty);
    std::cout << std::format("stage:    {} -> {} ({})\n", options.stage, result.stage,
                             tree_stage_name(result.stage));
    std::cout << std::format("progress: {:.4f} -> {:.4f}\n", options.progress, result.progress);
    return Result::Success;
}

void cmd_help() {
    std::cout << R"(Arbor CLI - Tree lifecycle simulation tool

Usage: arbor-cli <command> [options]

Commands:
  species                 List the species catalog

  simulate <species>      Plant one tree and tick it
                    --seconds <n>   Simulated time (required)
                    --dt <s>        Tick length (default: settings fixed_timestep)
                    --season <s>    spring, summer, autumn or winter (default: summer)
                    --weather <w>   clear, rain, drought or windstorm (default: clear)

  offline <species>       Run one offline catch-up
                    --seconds <n>   Time away (required, capped at 24h)
                    --stage <s>     Starting stage 0-4 (default: 0)
                    --progress <p>  Starting progress in [0, 1) (default: 0)

  help                    Show this help message

Global options:
  --settings <file>       Simulation settings JSON
  --catalog <file>        Species catalog JSON (overrides the settings entry)

Examples:
  arbor-cli species
  arbor-cli simulate white-oak --seconds 120 --season spring
  arbor-cli offline redwood --seconds 86400 --stage 1 --progress 0.5
)";
}

} // namespace arbor::cli
