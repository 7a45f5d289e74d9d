#include "minigolf/systems/boundary.hpp"

#include "minigolf/components/course.hpp"
#include "minigolf/core/debug.hpp"
#include "minigolf/core/profile.hpp"

namespace Systems {

bool BoundarySystem::resolveBoundary(Components::Position &pos,
                                     Components::Velocity &vel,
                                     double radius,
                                     const PolygonShape &polygon,
                                     double damping) {
    for (std::size_t i = 0; i < polygon.edgeCount(); ++i) {
        auto [a, b] = polygon.edge(i);

        Components::Position const nearest = closestPointOnLine(a, b, pos);
        double const dist = pos.dist(nearest);
        if (dist >= radius) {
            continue;
        }
        if (dist == 0.0) {
            continue;
        }

        Vector const normal = (pos - nearest).normalized();

        // Push the ball out so it just touches the edge
        pos = nearest + normal * radius;
        vel = vel.reflect(normal) * damping;
        return true;
    }
    return false;
}

void BoundarySystem::update(entt::registry &registry, double /*dt*/) {
    PROFILE_SCOPE("BoundarySystem");

    auto walls = registry.view<Components::Boundary, PolygonShape>();
    auto balls = registry.view<Components::Ball, Components::Position, Components::Velocity, Components::Radius>();

    for (auto [wallEntity, boundary, polygon] : walls.each()) {
        for (auto ball : balls) {
            auto &pos = balls.get<Components::Position>(ball);
            auto &vel = balls.get<Components::Velocity>(ball);
            double const radius = balls.get<Components::Radius>(ball).value;

            if (resolveBoundary(pos, vel, radius, polygon, boundary.damping)) {
                CollisionStats::recordBoundaryHit();
                DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "Boundary bounce at (" << pos.x << ", " << pos.y << ")\n");
            }
        }
    }
}

} // namespace Systems
