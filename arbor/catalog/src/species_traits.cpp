#include <arbor/catalog/species_traits.hpp>
#include <array>
#include <utility>

namespace arbor::catalog {

namespace {

SpeciesTraits cold_hardy() {
    SpeciesTraits t;
    t.winter_growth_mult = 0.5;
    return t;
}

SpeciesTraits near_water() {
    SpeciesTraits t;
    t.water_proximity_bonus = 1.2;
    return t;
}

SpeciesTraits clustering() {
    SpeciesTraits t;
    t.cluster_bonus_per_tree = 0.15;
    t.cluster_bonus_cap = 0.6;
    return t;
}

SpeciesTraits yield_boost(ResourceType resource, double multiplier, YieldCondition condition) {
    SpeciesTraits t;
    t.yield_boost = YieldBoost{resource, multiplier, condition};
    return t;
}

const std::array<std::pair<std::string_view, SpeciesTraits>, 5>& trait_table() {
    static const std::array<std::pair<std::string_view, SpeciesTraits>, 5> table = {{
        {"ghost-birch",  cold_hardy()},
        {"silver-birch", near_water()},
        {"mystic-fern",  clustering()},
        {"ironbark",     yield_boost(ResourceType::Timber, 3.0, YieldCondition::OldGrowth)},
        {"golden-apple", yield_boost(ResourceType::Fruit, 3.0, YieldCondition::Autumn)},
    }};
    return table;
}

} // namespace

const SpeciesTraits& species_traits(std::string_view species_id) {
    static const SpeciesTraits neutral{};
    for (const auto& [id, traits] : trait_table()) {
        if (id == species_id) return traits;
    }
    return neutral;
}

} // namespace arbor::catalog
