#pragma once

#include <arbor/lifecycle/growth.hpp>
#include <arbor/lifecycle/harvest.hpp>
#include <arbor/environment/weather.hpp>
#include <arbor/scene/systems.hpp>
#include <string>

namespace arbor::lifecycle {

// World conditions owned by the caller and read by the lifecycle systems each tick
struct LifecycleConditions {
    environment::Season season = environment::Season::Summer;
    environment::WeatherType weather = environment::WeatherType::Clear;
    std::string difficulty = "normal";      // Difficulty tier id; unknown ids act as normal

    GrowthConditions growth() const;
    HarvestConditions harvest() const;
};

// Registers, in FixedUpdate:
//   lifecycle.growth  (priority 10)
//   lifecycle.attach  (priority 5)
//   lifecycle.harvest (priority 0)
// `conditions` is captured by reference and must outlive the scheduler entries.
void register_lifecycle_systems(scene::Scheduler& scheduler, const LifecycleConditions& conditions);

} // namespace arbor::lifecycle
