#pragma once

#include <arbor/scene/world.hpp>
#include <array>
#include <functional>
#include <string>
#include <vector>

namespace arbor::scene {

// System execution phases, run in this order by the owner of the tick
enum class Phase {
    PreUpdate,      // Before simulation (apply player actions, refresh conditions)
    FixedUpdate,    // Fixed timestep simulation (growth, harvest cooldowns)
    Update,         // Variable timestep update
    PostUpdate      // After update (bookkeeping, consumers of the tick's results)
};

constexpr size_t PHASE_COUNT = 4;

// System function signature
using SystemFn = std::function<void(World&, double)>;

// System scheduler manages system registration and execution
class Scheduler {
public:
    Scheduler() = default;

    // Register a system for a specific phase
    // Higher priority systems run first (default 0)
    void add(Phase phase, SystemFn fn, int priority = 0);
    void add(Phase phase, SystemFn fn, const std::string& name, int priority = 0);

    // Remove a system by name
    void remove(const std::string& name);

    // Run all systems for a specific phase
    void run(World& world, double dt, Phase phase);

    // Run every phase in order
    void run_all(World& world, double dt);

    // Clear all systems
    void clear();

    // Enable/disable a system by name
    void set_enabled(const std::string& name, bool enabled);
    bool is_enabled(const std::string& name) const;

    bool contains(const std::string& name) const;
    size_t size(Phase phase) const;

private:
    struct SystemEntry {
        int priority;
        SystemFn fn;
        std::string name;
        bool enabled = true;
    };

    std::array<std::vector<SystemEntry>, PHASE_COUNT> m_systems;

    // Sort systems by priority after adding
    void sort_phase(Phase phase);
};

} // namespace arbor::scene
