/**
 * @file obstacle_collision.hpp
 * @brief System for swept collision between the ball and static obstacles
 *
 * This system handles:
 * - Continuous (swept) ball-versus-circle detection along the tick's
 *   travel segment, so a fast ball cannot pass through an obstacle
 * - A static overlap push-out when the ball did not move this tick
 * - Reflection and damping of the ball's velocity on contact
 *
 * Obstacles are visited once per tick in Obstacle pool order, which
 * spawnCourse sorts by Obstacle::order (course-list order). An obstacle
 * resolved later in the tick is not re-checked against earlier ones.
 *
 * Polygon obstacles are decoration only: they are dispatched but never
 * collide.
 *
 * Required components:
 * - Ball, Position, Velocity, Radius (the moving body)
 * - Obstacle, Shape, Position (circle obstacles)
 *
 * Optional components:
 * - PreviousPosition on the ball (start of the travel segment)
 */

#ifndef MINIGOLF_OBSTACLE_COLLISION_SYSTEM_HPP
#define MINIGOLF_OBSTACLE_COLLISION_SYSTEM_HPP

#include <entt/entt.hpp>
#include "minigolf/components/basic.hpp"
#include "minigolf/core/constants.hpp"
#include "minigolf/systems/i_system.hpp"

namespace Systems {

/**
 * @struct ObstacleCollisionConfig
 * @brief Configuration parameters specific to the obstacle collision system
 */
struct ObstacleCollisionConfig {
    // Squared travel distance below which the ball counts as stationary
    double stationaryDisplacementSq = SimulatorConstants::StationaryDisplacementSq;

    // Multiplier on the contact distance when placing the ball after a swept hit
    double separationSlop = SimulatorConstants::SeparationSlop;
};

/**
 * @class ObstacleCollisionSystem
 * @brief Resolves the ball against every static obstacle once per tick
 */
class ObstacleCollisionSystem : public ConfigurableSystem<ObstacleCollisionConfig> {
public:
    ObstacleCollisionSystem() = default;
    ~ObstacleCollisionSystem() override = default;

    /**
     * @brief Runs collide() for each ball against each obstacle
     * @param registry EnTT registry containing entities and components
     * @param dt Step length in seconds
     */
    void update(entt::registry &registry, double dt) override;

    /**
     * @brief Dispatches on the obstacle's shape
     *
     * Circle obstacles go through collideCircle(). Polygon obstacles are
     * a no-op.
     *
     * @return true if the ball was modified
     */
    bool collide(entt::registry &registry, entt::entity obstacle, entt::entity ball, double dt) const;

    /**
     * @brief Swept collision of the ball against a static circle
     *
     * The travel segment runs from prev (or pos - vel * dt when prev is
     * null) to pos. The earliest time of impact t in [0, 1] is found by
     * solving |start + d t - center|^2 = (obstacleRadius + ballRadius)^2.
     * On impact the ball is placed just outside the combined radius along
     * the contact normal and its velocity is reflected and damped. A tangent
     * path (zero discriminant) yields a single root and is resolved.
     *
     * @param center Obstacle center
     * @param obstacleRadius Obstacle radius
     * @param damping Velocity multiplier applied on contact
     * @param pos Ball center at the end of the tick (modified on contact)
     * @param prev Ball center at the start of the tick, may be null
     * @param vel Ball velocity (modified on contact)
     * @param ballRadius Ball radius
     * @param dt Step length in seconds, used only when prev is null
     * @param config Thresholds for the stationary test and separation
     * @return true if the ball was modified
     */
    static bool collideCircle(const Components::Position &center,
                              double obstacleRadius,
                              double damping,
                              Components::Position &pos,
                              const Components::PreviousPosition *prev,
                              Components::Velocity &vel,
                              double ballRadius,
                              double dt,
                              const ObstacleCollisionConfig &config = ObstacleCollisionConfig{});
};

} // namespace Systems

#endif // MINIGOLF_OBSTACLE_COLLISION_SYSTEM_HPP
