#pragma once

#include <vector>
#include "minigolf/systems/systems.hpp"

/**
 * @struct SystemConfig
 * @brief Holds all system configuration parameters for the simulation.
 */
struct SystemConfig {
    // Fixed tick length used by ECSSimulator::tick() without an explicit dt
    double SecondsPerTick = 1.0 / 60.0;

    // Shot strength per unit of aim distance
    double ShootStrength = 20.0;
    // Ceiling on the speed a single shot can give the ball
    double MaxShootStrength = 600.0;

    std::vector<Systems::SystemType> activeSystems;
};
