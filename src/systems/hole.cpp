#include "minigolf/systems/hole.hpp"

#include <utility>

#include "minigolf/components/course.hpp"
#include "minigolf/core/debug.hpp"
#include "minigolf/core/profile.hpp"

namespace Systems {

bool HoleSystem::containsBall(const Components::Position &holeCenter,
                              double holeRadius,
                              const Components::Position &ballPos) {
    return ballPos.dist(holeCenter) < holeRadius;
}

void HoleSystem::setHoleCallback(HoleCallback callback) {
    onHole = std::move(callback);
}

void HoleSystem::update(entt::registry &registry, double /*dt*/) {
    PROFILE_SCOPE("HoleSystem");

    auto holes = registry.view<Components::Hole, Components::Position, Components::Radius>();
    auto balls = registry.view<Components::Ball, Components::Position, Components::Velocity, Components::SpawnPoint>();

    for (auto ball : balls) {
        for (auto hole : holes) {
            const auto &center = holes.get<Components::Position>(hole);
            double const radius = holes.get<Components::Radius>(hole).value;

            if (!containsBall(center, radius, balls.get<Components::Position>(ball))) {
                continue;
            }

            CollisionStats::recordHole();
            if (onHole) {
                onHole(registry, hole, ball);
            }

            // Back to the tee, at rest
            const auto &spawn = balls.get<Components::SpawnPoint>(ball).value;
            balls.get<Components::Position>(ball) = spawn;
            balls.get<Components::Velocity>(ball) = Components::Velocity(0.0, 0.0);
            if (auto *prev = registry.try_get<Components::PreviousPosition>(ball)) {
                prev->value = spawn;
            }
        }
    }
}

} // namespace Systems
