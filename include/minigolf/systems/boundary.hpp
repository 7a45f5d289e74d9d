/**
 * @file boundary.hpp
 * @brief System for keeping the ball inside the course polygon
 *
 * This system handles:
 * - Finding the first boundary edge the ball overlaps
 * - Pushing the ball back out so it just touches that edge
 * - Reflecting the velocity about the edge normal
 * - Applying the boundary's bounce damping
 *
 * At most one edge is resolved per ball per tick. Edges are visited in
 * vertex order and the first overlapping one wins; there is no iterative
 * solve over the remaining edges.
 *
 * Required components:
 * - Ball, Position, Velocity, Radius (the moving body)
 * - Boundary, PolygonShape (the course wall)
 */

#ifndef MINIGOLF_BOUNDARY_SYSTEM_HPP
#define MINIGOLF_BOUNDARY_SYSTEM_HPP

#include <entt/entt.hpp>
#include "minigolf/components/basic.hpp"
#include "minigolf/math/polygon.hpp"
#include "minigolf/systems/i_system.hpp"

namespace Systems {

/**
 * @class BoundarySystem
 * @brief Resolves ball-versus-wall contacts against the course polygon
 */
class BoundarySystem : public ISystem {
public:
    BoundarySystem() = default;
    ~BoundarySystem() override = default;

    /**
     * @brief Checks and processes boundary collisions
     * @param registry EnTT registry containing entities and components
     * @param dt Step length in seconds (unused)
     */
    void update(entt::registry &registry, double dt) override;

    /**
     * @brief Resolves the ball against the first overlapping edge of a polygon
     *
     * An edge whose nearest point coincides with the ball center is skipped,
     * since no normal can be derived from it.
     *
     * @param pos Ball center, moved to nearest + normal * radius on contact
     * @param vel Ball velocity, reflected and multiplied by damping on contact
     * @param radius Ball radius
     * @param polygon Closed boundary loop
     * @param damping Velocity multiplier applied on bounce
     * @return true if an edge was resolved
     */
    static bool resolveBoundary(Components::Position &pos,
                                Components::Velocity &vel,
                                double radius,
                                const PolygonShape &polygon,
                                double damping);
};

} // namespace Systems

#endif // MINIGOLF_BOUNDARY_SYSTEM_HPP
