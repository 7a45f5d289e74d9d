/**
 * @file hole.hpp
 * @brief System for detecting a holed ball and respawning it
 *
 * This system handles:
 * - Testing the ball's center against every hole
 * - Notifying the owner through a callback when the ball drops in
 * - Returning the ball to its spawn point at rest
 *
 * Required components:
 * - Ball, Position, Velocity, SpawnPoint (the moving body)
 * - Hole, Position, Radius (the goal regions)
 *
 * Optional components:
 * - PreviousPosition on the ball (reset alongside the position)
 */

#ifndef MINIGOLF_HOLE_SYSTEM_HPP
#define MINIGOLF_HOLE_SYSTEM_HPP

#include <functional>
#include <entt/entt.hpp>
#include "minigolf/components/basic.hpp"
#include "minigolf/systems/i_system.hpp"

namespace Systems {

/**
 * @class HoleSystem
 * @brief Checks goal containment and respawns the ball
 */
class HoleSystem : public ISystem {
public:
    /**
     * @brief Called once per holed ball, before the ball is moved back to its spawn point
     */
    using HoleCallback = std::function<void(entt::registry &, entt::entity hole, entt::entity ball)>;

    HoleSystem() = default;
    ~HoleSystem() override = default;

    /**
     * @brief Tests every ball against every hole
     * @param registry EnTT registry containing entities and components
     * @param dt Step length in seconds (unused)
     */
    void update(entt::registry &registry, double dt) override;

    /**
     * @brief Registers the callback fired when a ball is holed
     */
    void setHoleCallback(HoleCallback callback);

    /**
     * @brief True iff the ball's center lies strictly inside the hole
     */
    static bool containsBall(const Components::Position &holeCenter,
                             double holeRadius,
                             const Components::Position &ballPos);

private:
    HoleCallback onHole;
};

} // namespace Systems

#endif // MINIGOLF_HOLE_SYSTEM_HPP
