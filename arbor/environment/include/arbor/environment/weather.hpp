#pragma once

#include <arbor/environment/season.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace arbor::environment {

enum class WeatherType : uint8_t {
    Clear,      // Normal conditions
    Rain,       // Faster growth
    Drought,    // Slower growth
    Windstorm   // No growth effect
};

const char* weather_type_to_string(WeatherType type);
std::optional<WeatherType> weather_type_from_string(std::string_view name);

// Growth multiplier fed to the growth sweep: rain 1.3, drought 0.5, otherwise 1.0
double weather_growth_multiplier(WeatherType type);

// Seconds of game time between weather rolls
constexpr double WEATHER_CHECK_INTERVAL = 300.0;

struct WeatherEvent {
    WeatherType type = WeatherType::Clear;
    double start_time = 0.0;   // Game seconds
    double duration = 0.0;

    double end_time() const { return start_time + duration; }
};

struct WeatherState {
    WeatherEvent current;
    double next_check_time = 0.0;
};

// Clear skies until the first roll one check interval from now
WeatherState initialize_weather(double current_time);

// Advance the weather. An active event is kept until it ends; between the end
// of an event and the next check the weather is clear; at a check a new event
// is rolled from the season's probability table. Deterministic in
// (state, current_time, season, seed).
WeatherState update_weather(const WeatherState& state, double current_time,
                            Season season, uint64_t seed);

// Weather type for a roll in [0, 1) under a season's probability table
WeatherType roll_weather_type(double roll, Season season);

// Event duration for a roll in [0, 1); clear weather lasts one check interval
double roll_weather_duration(WeatherType type, double roll);

} // namespace arbor::environment
