#pragma once

/**
 * @brief Defines available ECS systems for the golf simulation.
 */
namespace Systems {

/**
 * @enum SystemType
 * @brief The ECS systems that can be activated by a course.
 *
 * Listed in the order the simulator runs them each tick.
 */
enum class SystemType {
    MOVEMENT,
    OBSTACLE_COLLISION,
    BOUNDARY,
    HOLE,
};

} // namespace Systems
