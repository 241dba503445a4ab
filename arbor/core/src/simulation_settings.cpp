#include <arbor/core/simulation_settings.hpp>
#include <arbor/core/filesystem.hpp>
#include <arbor/core/log.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>

namespace arbor::core {

using json = nlohmann::json;

SimulationSettings& SimulationSettings::get() {
    static SimulationSettings instance;
    return instance;
}

bool SimulationSettings::load(const std::string& path) {
    std::string content = FileSystem::read_text(path);
    if (content.empty()) {
        log(LogLevel::Error, "Failed to read simulation settings: {}", path);
        return false;
    }
    return load_from_string(content);
}

bool SimulationSettings::load_from_string(const std::string& content) {
    try {
        json j = json::parse(content);
        if (!j.is_object()) {
            log(LogLevel::Error, "Simulation settings must be a JSON object");
            return false;
        }

        // Parse into a copy so a type error halfway through leaves us untouched
        SimulationSettings parsed = *this;
        parsed.difficulty = j.value("difficulty", parsed.difficulty);
        parsed.fixed_timestep = j.value("fixed_timestep", parsed.fixed_timestep);
        parsed.offline_cap_seconds = j.value("offline_cap_seconds", parsed.offline_cap_seconds);
        parsed.species_catalog = j.value("species_catalog", parsed.species_catalog);
        parsed.log_level = j.value("log_level", parsed.log_level);

        if (parsed.fixed_timestep <= 0.0) {
            log(LogLevel::Warn, "Ignoring non-positive fixed_timestep {}", parsed.fixed_timestep);
            parsed.fixed_timestep = fixed_timestep;
        }

        *this = parsed;
        return true;
    } catch (const json::exception& e) {
        log(LogLevel::Error, "Failed to parse simulation settings: {}", e.what());
        return false;
    }
}

bool SimulationSettings::save(const std::string& path) const {
    return FileSystem::write_text(path, to_json_string());
}

std::string SimulationSettings::to_json_string() const {
    json j;
    j["difficulty"] = difficulty;
    j["fixed_timestep"] = fixed_timestep;
    j["offline_cap_seconds"] = offline_cap_seconds;
    j["species_catalog"] = species_catalog;
    j["log_level"] = log_level;
    return j.dump(4);
}

void SimulationSettings::reset() {
    *this = SimulationSettings{};
}

double SimulationSettings::effective_offline_cap() const {
    return std::clamp(offline_cap_seconds, 0.0, MAX_OFFLINE_SECONDS);
}

} // namespace arbor::core
