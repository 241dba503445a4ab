#include <arbor/environment/weather.hpp>
#include <random>

namespace arbor::environment {

namespace {

struct SeasonWeatherOdds {
    double rain;
    double drought;
    double windstorm;
    // Remainder is clear
};

SeasonWeatherOdds season_odds(Season season) {
    switch (season) {
        case Season::Spring: return {0.30, 0.05, 0.10};
        case Season::Summer: return {0.15, 0.25, 0.05};
        case Season::Autumn: return {0.20, 0.10, 0.20};
        case Season::Winter: return {0.05, 0.15, 0.15};
    }
    return {0.15, 0.25, 0.05};
}

// splitmix64 finaliser, used to derive a per-check seed
uint64_t mix_seed(uint64_t x) {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

// Uniform [0, 1) from the top 24 bits, identical on every standard library
double next_unit(std::mt19937& rng) {
    return static_cast<double>(rng() >> 8) * (1.0 / 16777216.0);
}

} // namespace

const char* weather_type_to_string(WeatherType type) {
    switch (type) {
        case WeatherType::Clear:     return "clear";
        case WeatherType::Rain:      return "rain";
        case WeatherType::Drought:   return "drought";
        case WeatherType::Windstorm: return "windstorm";
    }
    return "clear";
}

std::optional<WeatherType> weather_type_from_string(std::string_view name) {
    if (name == "clear")     return WeatherType::Clear;
    if (name == "rain")      return WeatherType::Rain;
    if (name == "drought")   return WeatherType::Drought;
    if (name == "windstorm") return WeatherType::Windstorm;
    return std::nullopt;
}

double weather_growth_multiplier(WeatherType type) {
    switch (type) {
        case WeatherType::Rain:    return 1.3;
        case WeatherType::Drought: return 0.5;
        case WeatherType::Clear:
        case WeatherType::Windstorm:
            return 1.0;
    }
    return 1.0;
}

WeatherState initialize_weather(double current_time) {
    WeatherState state;
    state.current = {WeatherType::Clear, current_time, WEATHER_CHECK_INTERVAL};
    state.next_check_time = current_time + WEATHER_CHECK_INTERVAL;
    return state;
}

WeatherType roll_weather_type(double roll, Season season) {
    SeasonWeatherOdds odds = season_odds(season);
    if (roll < odds.rain) return WeatherType::Rain;
    if (roll < odds.rain + odds.drought) return WeatherType::Drought;
    if (roll < odds.rain + odds.drought + odds.windstorm) return WeatherType::Windstorm;
    return WeatherType::Clear;
}

double roll_weather_duration(WeatherType type, double roll) {
    double min = WEATHER_CHECK_INTERVAL;
    double max = WEATHER_CHECK_INTERVAL;
    switch (type) {
        case WeatherType::Rain:      min = 60.0; max = 120.0; break;
        case WeatherType::Drought:   min = 90.0; max = 180.0; break;
        case WeatherType::Windstorm: min = 30.0; max = 60.0;  break;
        case WeatherType::Clear: break;
    }
    return min + (max - min) * roll;
}

WeatherState update_weather(const WeatherState& state, double current_time,
                            Season season, uint64_t seed) {
    double event_end = state.current.end_time();

    // Event still active
    if (current_time < event_end) {
        return state;
    }

    // Event over but no roll due yet: clear until the next check. The waiting
    // event ends at the check, so it is returned unchanged by the branch above.
    if (current_time < state.next_check_time) {
        WeatherState waiting;
        waiting.current = {WeatherType::Clear, event_end, state.next_check_time - event_end};
        waiting.next_check_time = state.next_check_time;
        return waiting;
    }

    uint64_t check_bits = static_cast<uint64_t>(state.next_check_time * 1000.0);
    std::mt19937 rng(static_cast<std::mt19937::result_type>(mix_seed(seed ^ mix_seed(check_bits))));

    double type_roll = next_unit(rng);
    double duration_roll = next_unit(rng);

    WeatherState next;
    next.current.type = roll_weather_type(type_roll, season);
    next.current.start_time = state.next_check_time;
    next.current.duration = roll_weather_duration(next.current.type, duration_roll);
    next.next_check_time = state.next_check_time + WEATHER_CHECK_INTERVAL;
    return next;
}

} // namespace arbor::environment
