#include <arbor/catalog/species.hpp>
#include <arbor/core/filesystem.hpp>
#include <arbor/core/log.hpp>
#include <nlohmann/json.hpp>
#include <optional>

namespace arbor::catalog {

using json = nlohmann::json;
using core::log;
using core::LogLevel;

namespace {

SpeciesData make_species(std::string id, std::string name, int difficulty, int unlock_level,
                         std::string biome, std::array<double, GROWTH_TIME_SLOTS> times,
                         std::vector<ResourceYield> yields, double harvest_cycle_sec,
                         bool evergreen) {
    SpeciesData s;
    s.id = std::move(id);
    s.name = std::move(name);
    s.difficulty = difficulty;
    s.unlock_level = unlock_level;
    s.biome = std::move(biome);
    s.base_growth_times = times;
    s.yields = std::move(yields);
    s.harvest_cycle_sec = harvest_cycle_sec;
    s.evergreen = evergreen;
    return s;
}

// Returns nullopt and fills `error` if the entry is unusable
std::optional<SpeciesData> parse_species(const json& j, std::string& error) {
    if (!j.is_object()) {
        error = "entry is not an object";
        return std::nullopt;
    }

    SpeciesData s;
    s.id = j.value("id", std::string{});
    if (s.id.empty()) {
        error = "missing id";
        return std::nullopt;
    }

    s.name = j.value("name", s.id);
    s.difficulty = j.value("difficulty", 0);
    if (s.difficulty < 1 || s.difficulty > 5) {
        error = "difficulty must be 1-5";
        return std::nullopt;
    }

    s.unlock_level = j.value("unlock_level", 1);
    s.biome = j.value("biome", std::string{});
    s.harvest_cycle_sec = j.value("harvest_cycle_sec", 0.0);
    s.evergreen = j.value("evergreen", false);

    if (j.contains("base_growth_times")) {
        const auto& times = j["base_growth_times"];
        if (!times.is_array() || times.size() > GROWTH_TIME_SLOTS) {
            error = "base_growth_times must be an array of at most 5 numbers";
            return std::nullopt;
        }
        // Missing trailing entries stay 0, which freezes growth at that stage
        for (size_t i = 0; i < times.size(); ++i) {
            s.base_growth_times[i] = times[i].get<double>();
        }
    }

    if (!j.contains("yield") || !j["yield"].is_array() || j["yield"].empty()) {
        error = "yield must be a non-empty array";
        return std::nullopt;
    }
    for (const auto& entry : j["yield"]) {
        auto type = resource_type_from_string(entry.value("resource", std::string{}));
        if (!type) {
            error = "unknown resource type";
            return std::nullopt;
        }
        int amount = entry.value("amount", 0);
        if (amount < 0) {
            error = "negative yield amount";
            return std::nullopt;
        }
        s.yields.push_back({*type, amount});
    }

    return s;
}

} // namespace

bool SpeciesCatalog::add(SpeciesData species) {
    if (species.id.empty()) return false;

    auto it = m_index.find(species.id);
    if (it != m_index.end()) {
        m_species[it->second] = std::move(species);
        return true;
    }

    m_index.emplace(species.id, m_species.size());
    m_species.push_back(std::move(species));
    return true;
}

const SpeciesData* SpeciesCatalog::find(const std::string& id) const {
    auto it = m_index.find(id);
    return it != m_index.end() ? &m_species[it->second] : nullptr;
}

void SpeciesCatalog::clear() {
    m_species.clear();
    m_index.clear();
}

void SpeciesCatalog::load_defaults() {
    clear();
    for (auto& species : default_species()) {
        add(std::move(species));
    }
}

bool SpeciesCatalog::load_json(const std::string& path) {
    std::string content = core::FileSystem::read_text(path);
    if (content.empty()) {
        log(LogLevel::Error, "Failed to read species catalog: {}", path);
        return false;
    }

    if (!load_json_string(content)) {
        return false;
    }
    log(LogLevel::Info, "Loaded species catalog from {} ({} species)", path, size());
    return true;
}

bool SpeciesCatalog::load_json_string(const std::string& content) {
    json root;
    try {
        root = json::parse(content);
    } catch (const json::exception& e) {
        log(LogLevel::Error, "Failed to parse species catalog: {}", e.what());
        return false;
    }

    const json* entries = &root;
    if (root.is_object() && root.contains("species")) {
        entries = &root["species"];
    }
    if (!entries->is_array()) {
        log(LogLevel::Error, "Species catalog must be an array or {\"species\": [...]}");
        return false;
    }

    size_t index = 0;
    for (const auto& entry : *entries) {
        std::string error;
        std::optional<SpeciesData> species;
        try {
            species = parse_species(entry, error);
        } catch (const json::exception& e) {
            error = e.what();
        }

        if (species) {
            add(std::move(*species));
        } else {
            log(LogLevel::Warn, "Skipping species entry {}: {}", index, error);
        }
        ++index;
    }
    return true;
}

std::vector<SpeciesData> default_species() {
    using R = ResourceType;
    return {
        make_species("white-oak", "White Oak", 1, 1, "Temperate",
                     {10, 15, 20, 25, 30}, {{R::Timber, 2}}, 45, false),
        make_species("weeping-willow", "Weeping Willow", 2, 2, "Wetland",
                     {12, 18, 24, 30, 36}, {{R::Sap, 3}}, 60, false),
        make_species("elder-pine", "Elder Pine", 2, 3, "Mountain",
                     {12, 16, 22, 28, 35}, {{R::Timber, 2}, {R::Sap, 1}}, 50, true),
        make_species("cherry-blossom", "Cherry Blossom", 3, 5, "Temperate",
                     {15, 22, 30, 38, 45}, {{R::Fruit, 2}}, 75, false),
        make_species("ghost-birch", "Ghost Birch", 3, 6, "Tundra Edge",
                     {14, 20, 28, 36, 42}, {{R::Sap, 2}, {R::Acorns, 1}}, 55, false),
        make_species("redwood", "Redwood", 4, 8, "Coastal",
                     {20, 30, 45, 60, 75}, {{R::Timber, 5}}, 120, true),
        make_species("flame-maple", "Flame Maple", 4, 10, "Highland",
                     {18, 26, 36, 48, 58}, {{R::Fruit, 3}}, 90, false),
        make_species("baobab", "Baobab", 5, 12, "Savanna",
                     {25, 35, 50, 65, 80}, {{R::Timber, 2}, {R::Sap, 2}, {R::Fruit, 2}}, 150, false),
        make_species("silver-birch", "Silver Birch", 2, 9, "Riverbank",
                     {12, 16, 22, 28, 34}, {{R::Sap, 2}, {R::Timber, 1}}, 50, false),
        make_species("ironbark", "Ironbark", 4, 14, "Dry Forest",
                     {22, 32, 48, 62, 78}, {{R::Timber, 4}, {R::Sap, 1}}, 130, false),
        make_species("golden-apple", "Golden Apple", 3, 18, "Orchard",
                     {16, 24, 32, 40, 48}, {{R::Fruit, 3}, {R::Acorns, 1}}, 80, false),
        make_species("mystic-fern", "Mystic Fern", 3, 22, "Enchanted Grove",
                     {14, 20, 26, 34, 40}, {{R::Sap, 2}, {R::Acorns, 1}}, 65, false),
    };
}

SpeciesCatalog& get_species_catalog() {
    static SpeciesCatalog catalog = [] {
        SpeciesCatalog c;
        c.load_defaults();
        return c;
    }();
    return catalog;
}

} // namespace arbor::catalog
