#pragma once

#include <arbor/catalog/resources.hpp>
#include <array>
#include <string>
#include <unordered_map>
#include <vector>

namespace arbor::catalog {

// Number of entries in SpeciesData::base_growth_times (one per stage 0-4)
constexpr size_t GROWTH_TIME_SLOTS = 5;

// Static description of a tree species. Read-only once registered.
struct SpeciesData {
    std::string id;
    std::string name;
    int difficulty = 1;                 // 1-5, selects the growth divisor
    int unlock_level = 1;
    std::string biome;

    // Seconds to complete each stage. Only stages 0-3 are read by the
    // simulation; stage 4 is terminal. A value <= 0 freezes growth there.
    std::array<double, GROWTH_TIME_SLOTS> base_growth_times{};

    std::vector<ResourceYield> yields;  // Base, unmultiplied per-cycle yield
    double harvest_cycle_sec = 0.0;
    bool evergreen = false;

    // Base time for a stage, or 0 if the stage has no entry
    double growth_time(int stage) const {
        if (stage < 0 || stage >= static_cast<int>(GROWTH_TIME_SLOTS)) return 0.0;
        return base_growth_times[static_cast<size_t>(stage)];
    }
};

class SpeciesCatalog {
public:
    SpeciesCatalog() = default;

    // Add or replace a species (keyed by id). Returns false for an empty id.
    bool add(SpeciesData species);

    // nullptr if the id is unknown
    const SpeciesData* find(const std::string& id) const;
    bool contains(const std::string& id) const { return find(id) != nullptr; }

    const std::vector<SpeciesData>& all() const { return m_species; }
    size_t size() const { return m_species.size(); }
    void clear();

    // Replace contents with the built-in species set
    void load_defaults();

    // Load species from JSON, either a top-level array or {"species": [...]}.
    // Entries that fail validation are skipped with a warning; the file as a
    // whole fails only if it cannot be read or parsed.
    bool load_json(const std::string& path);
    bool load_json_string(const std::string& content);

private:
    std::vector<SpeciesData> m_species;
    std::unordered_map<std::string, size_t> m_index;
};

// Built-in species set
std::vector<SpeciesData> default_species();

// Global catalog, preloaded with default_species()
SpeciesCatalog& get_species_catalog();

} // namespace arbor::catalog
