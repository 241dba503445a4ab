#include <arbor/lifecycle/tree_components.hpp>

namespace arbor::lifecycle {

const char* tree_stage_name(int stage) {
    switch (stage) {
        case TreeStage::Seed:      return "Seed";
        case TreeStage::Sprout:    return "Sprout";
        case TreeStage::Sapling:   return "Sapling";
        case TreeStage::Mature:    return "Mature";
        case TreeStage::OldGrowth: return "Old Growth";
        default:                   return "Unknown";
    }
}

} // namespace arbor::lifecycle
