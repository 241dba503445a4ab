#pragma once

#include <arbor/lifecycle/tree_components.hpp>
#include <arbor/catalog/species.hpp>
#include <arbor/core/simulation_settings.hpp>
#include <arbor/scene/world.hpp>
#include <string>
#include <vector>

namespace arbor::lifecycle {

// Growth state fed to and produced by the offline integrator
struct OfflineTreeState {
    std::string species_id;
    int stage = TreeStage::Seed;
    double progress = 0.0;
    bool watered = false;
};

struct OfflineGrowthResult {
    int stage = TreeStage::Seed;
    double progress = 0.0;
    bool watered = false;       // Always false: water evaporates while away
};

// Options for a catch-up run
struct OfflineGrowthOptions {
    double growth_scalar = 1.0;                     // Active difficulty tier growth scalar
    double cap_seconds = core::MAX_OFFLINE_SECONDS; // Clamped to MAX_OFFLINE_SECONDS
};

// Closed-form catch-up of one tree over `elapsed_seconds`.
// Uses the per-tick rate formula with season fixed to summer and no water,
// fertilizer, weather, structure or neighbour bonuses. Elapsed time is clamped
// into [0, cap]. May cross several stages in one call.
OfflineGrowthResult calculate_offline_growth(const OfflineTreeState& tree, double elapsed_seconds,
                                             const catalog::SpeciesData& species,
                                             const OfflineGrowthOptions& options = {});

// Batch form; results are in input order. Trees with unknown species keep
// their stage and progress and only lose their water.
std::vector<OfflineGrowthResult> calculate_all_offline_growth(
    const std::vector<OfflineTreeState>& trees, double elapsed_seconds,
    const catalog::SpeciesCatalog& species_catalog, const OfflineGrowthOptions& options = {});

// Runs the catch-up over every tree in the world and writes the results back.
// Harvest facets are not advanced. Returns the number of trees that changed stage.
size_t apply_offline_growth(scene::World& world, double elapsed_seconds,
                            const catalog::SpeciesCatalog& species_catalog,
                            const OfflineGrowthOptions& options = {});

} // namespace arbor::lifecycle
