#include <arbor/environment/season.hpp>

namespace arbor::environment {

const char* season_to_string(Season season) {
    switch (season) {
        case Season::Spring: return "spring";
        case Season::Summer: return "summer";
        case Season::Autumn: return "autumn";
        case Season::Winter: return "winter";
    }
    return "summer";
}

std::optional<Season> season_from_string(std::string_view name) {
    if (name == "spring") return Season::Spring;
    if (name == "summer") return Season::Summer;
    if (name == "autumn") return Season::Autumn;
    if (name == "winter") return Season::Winter;
    return std::nullopt;
}

Season season_from_string_or(std::string_view name, Season fallback) {
    return season_from_string(name).value_or(fallback);
}

double season_growth_multiplier(Season season) {
    switch (season) {
        case Season::Spring: return 1.5;
        case Season::Summer: return 1.0;
        case Season::Autumn: return 0.8;
        case Season::Winter: return 0.0;
    }
    return 1.0;
}

} // namespace arbor::environment
