#include <arbor/lifecycle/offline_growth.hpp>
#include <arbor/lifecycle/growth.hpp>
#include <arbor/core/log.hpp>
#include <algorithm>

namespace arbor::lifecycle {

using namespace arbor::scene;
using core::log;
using core::LogLevel;

namespace {

OfflineGrowthResult unchanged_but_dry(int stage, double progress) {
    return {stage, progress, false};
}

double effective_elapsed(double elapsed_seconds, const OfflineGrowthOptions& options) {
    double cap = std::clamp(options.cap_seconds, 0.0, core::MAX_OFFLINE_SECONDS);
    return std::clamp(elapsed_seconds, 0.0, cap);
}

} // namespace

OfflineGrowthResult calculate_offline_growth(const OfflineTreeState& tree, double elapsed_seconds,
                                             const catalog::SpeciesData& species,
                                             const OfflineGrowthOptions& options) {
    double remaining = effective_elapsed(elapsed_seconds, options);

    OfflineGrowthResult result;
    result.stage = tree.stage;
    result.progress = tree.progress;
    result.watered = false;

    if (result.stage >= MAX_STAGE) {
        result.stage = MAX_STAGE;
        result.progress = std::min(result.progress, TERMINAL_PROGRESS_CAP);
        return result;
    }

    while (remaining > 0.0 && result.stage < MAX_STAGE) {
        double base_time = species.growth_time(result.stage);
        if (base_time <= 0.0) break;

        double rate = calc_growth_rate(base_time, species.difficulty, Season::Summer,
                                       false, species.evergreen) * options.growth_scalar;
        if (rate <= 0.0) break;

        double seconds_to_fill = (1.0 - result.progress) / rate;
        if (remaining >= seconds_to_fill) {
            remaining -= seconds_to_fill;
            result.stage += 1;
            result.progress = 0.0;
        } else {
            result.progress += rate * remaining;
            remaining = 0.0;
        }
    }

    result.stage = std::min(result.stage, MAX_STAGE);
    result.progress = std::min(result.progress, 1.0);
    if (result.stage >= MAX_STAGE) {
        result.progress = std::min(result.progress, TERMINAL_PROGRESS_CAP);
    }
    return result;
}

std::vector<OfflineGrowthResult> calculate_all_offline_growth(
    const std::vector<OfflineTreeState>& trees, double elapsed_seconds,
    const catalog::SpeciesCatalog& species_catalog, const OfflineGrowthOptions& options) {
    std::vector<OfflineGrowthResult> results;
    results.reserve(trees.size());

    for (const auto& tree : trees) {
        const catalog::SpeciesData* species = species_catalog.find(tree.species_id);
        if (!species) {
            results.push_back(unchanged_but_dry(tree.stage, tree.progress));
            continue;
        }
        results.push_back(calculate_offline_growth(tree, elapsed_seconds, *species, options));
    }

    return results;
}

size_t apply_offline_growth(World& world, double elapsed_seconds,
                            const catalog::SpeciesCatalog& species_catalog,
                            const OfflineGrowthOptions& options) {
    size_t advanced = 0;
    size_t total = 0;

    auto view = world.view<TreeComponent>();
    for (auto entity : view) {
        auto& tree = view.get<TreeComponent>(entity);
        ++total;

        OfflineGrowthResult result;
        const catalog::SpeciesData* species = species_catalog.find(tree.species_id);
        if (species) {
            OfflineTreeState state{tree.species_id, tree.stage, tree.progress, tree.watered};
            result = calculate_offline_growth(state, elapsed_seconds, *species, options);
        } else {
            result = unchanged_but_dry(tree.stage, tree.progress);
        }

        if (result.stage != tree.stage) {
            ++advanced;
            // Stage-scoped bonuses expire with the stage, as in the per-tick path
            tree.fertilized = false;
        }

        tree.stage = result.stage;
        tree.progress = result.progress;
        tree.watered = result.watered;

        if (auto* visual = world.try_get<TreeVisual>(entity)) {
            visual->scale = stage_scale(tree.stage, tree.progress);
        }
    }

    log(LogLevel::Info, "Offline catch-up of {:.0f}s applied to {} trees ({} changed stage)",
        effective_elapsed(elapsed_seconds, options), total, advanced);
    return advanced;
}

} // namespace arbor::lifecycle
