/**
 * @file movement.hpp
 * @brief System for integrating the ball's position and rolling friction
 *
 * This system handles:
 * - Capturing the position at the start of the tick
 * - Position updates using velocity
 * - Time-scaled velocity damping from the ball's friction
 * - Stopping the ball once it is slower than a rest threshold
 *
 * Required components:
 * - Position (to modify)
 * - PreviousPosition (to overwrite)
 * - Velocity (to read/modify)
 * - Friction (to read)
 */

#ifndef MINIGOLF_MOVEMENT_SYSTEM_HPP
#define MINIGOLF_MOVEMENT_SYSTEM_HPP

#include <entt/entt.hpp>
#include "minigolf/components/basic.hpp"
#include "minigolf/core/constants.hpp"
#include "minigolf/systems/i_system.hpp"

namespace Systems {

/**
 * @struct MovementConfig
 * @brief Configuration parameters specific to the movement system
 */
struct MovementConfig {
    // Speed (units/s) below which velocity is snapped to zero
    double restSpeedThreshold = SimulatorConstants::RestSpeedThreshold;
};

/**
 * @class MovementSystem
 * @brief Advances every moving body by one tick
 */
class MovementSystem : public ConfigurableSystem<MovementConfig> {
public:
    MovementSystem() = default;
    ~MovementSystem() override = default;

    /**
     * @brief Integrates all bodies that carry friction
     * @param registry EnTT registry containing entities and components
     * @param dt Step length in seconds
     */
    void update(entt::registry &registry, double dt) override;

    /**
     * @brief Integrates a single body
     *
     * prev is set to pos before anything moves; pos advances by vel * dt;
     * vel is scaled by 1 - (1 - friction) * dt and zeroed when its length
     * drops below restSpeed.
     *
     * @throws std::invalid_argument if dt is not a positive finite number
     * @return true if the body came to rest on this tick
     */
    static bool integrate(Components::Position &pos,
                          Components::PreviousPosition &prev,
                          Components::Velocity &vel,
                          double friction,
                          double dt,
                          double restSpeed = SimulatorConstants::RestSpeedThreshold);
};

} // namespace Systems

#endif // MINIGOLF_MOVEMENT_SYSTEM_HPP
