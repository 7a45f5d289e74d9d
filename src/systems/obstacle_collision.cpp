#include "minigolf/systems/obstacle_collision.hpp"

#include <cmath>

#include "minigolf/components/course.hpp"
#include "minigolf/core/debug.hpp"
#include "minigolf/core/profile.hpp"

namespace Systems {

bool ObstacleCollisionSystem::collideCircle(const Components::Position &center,
                                            double obstacleRadius,
                                            double damping,
                                            Components::Position &pos,
                                            const Components::PreviousPosition *prev,
                                            Components::Velocity &vel,
                                            double ballRadius,
                                            double dt,
                                            const ObstacleCollisionConfig &config) {
    // Travel segment for this tick
    Components::Position const start = prev ? prev->value : pos + vel * (-dt);
    Components::Position const end = pos;
    Vector const d = end - start;

    // Combined radius: obstacle radius + ball radius
    double const r = obstacleRadius + ballRadius;

    // Ball has not moved: plain overlap test
    if (d.lengthSquared() < config.stationaryDisplacementSq) {
        double const dist = pos.dist(center);
        if (dist < r && dist > 0.0) {
            Vector const normal = (pos - center).normalized();
            pos = center + normal * r;
            vel = vel.reflect(normal) * damping;
            return true;
        }
        return false;
    }

    Vector const f = start - center;
    double const a = d.dotProduct(d);
    double const b = 2.0 * f.dotProduct(d);
    double const c = f.dotProduct(f) - r * r;

    double discriminant = b * b - 4.0 * a * c;
    if (discriminant < 0.0) {
        return false;
    }

    discriminant = std::sqrt(discriminant);
    double const t1 = (-b - discriminant) / (2.0 * a);
    double const t2 = (-b + discriminant) / (2.0 * a);

    double t = -1.0;
    if (t1 >= 0.0 && t1 <= 1.0) {
        t = t1;
    } else if (t2 >= 0.0 && t2 <= 1.0) {
        t = t2;
    }
    if (t < 0.0) {
        // Contact lies outside this tick's travel
        return false;
    }

    Components::Position const contact = start + d * t;
    Vector const normal = (contact - center).normalized();

    pos = center + normal * (r * config.separationSlop);
    vel = vel.reflect(normal) * damping;
    return true;
}

bool ObstacleCollisionSystem::collide(entt::registry &registry,
                                      entt::entity obstacle,
                                      entt::entity ball,
                                      double dt) const {
    const auto &shape = registry.get<Components::Shape>(obstacle);
    const auto &props = registry.get<Components::Obstacle>(obstacle);

    switch (shape.type) {
        case Components::ShapeType::Circle: {
            const auto &center = registry.get<Components::Position>(obstacle);
            auto &pos = registry.get<Components::Position>(ball);
            auto &vel = registry.get<Components::Velocity>(ball);
            double const ballRadius = registry.get<Components::Radius>(ball).value;
            const auto *prev = registry.try_get<Components::PreviousPosition>(ball);

            return collideCircle(center, shape.size, props.damping,
                                 pos, prev, vel, ballRadius, dt, specificConfig);
        }
        case Components::ShapeType::Polygon:
            // Polygon obstacles are drawn by the front end but never collide.
            return false;
    }
    return false;
}

void ObstacleCollisionSystem::update(entt::registry &registry, double dt) {
    PROFILE_SCOPE("ObstacleCollisionSystem");

    // The Obstacle pool is kept sorted by course order (see spawnCourse)
    auto obstacles = registry.view<Components::Obstacle>();

    auto balls = registry.view<Components::Ball, Components::Position, Components::Velocity, Components::Radius>();
    for (auto ball : balls) {
        for (auto obstacle : obstacles) {
            if (collide(registry, obstacle, ball, dt)) {
                CollisionStats::recordObstacleHit();
                DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "Obstacle " << registry.get<Components::Obstacle>(obstacle).order
                          << " hit\n");
            }
        }
    }
}

} // namespace Systems
