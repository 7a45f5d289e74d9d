#include "minigolf/systems/movement.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "minigolf/core/debug.hpp"
#include "minigolf/core/profile.hpp"

namespace Systems {

bool MovementSystem::integrate(Components::Position &pos,
                               Components::PreviousPosition &prev,
                               Components::Velocity &vel,
                               double friction,
                               double dt,
                               double restSpeed) {
    if (!(dt > 0.0) || !std::isfinite(dt)) {
        throw std::invalid_argument("MovementSystem: dt must be positive and finite, got " +
                                    std::to_string(dt));
    }

    // Snapshot before any movement this tick
    prev.value = pos;

    pos += vel * dt;
    vel *= 1.0 - (1.0 - friction) * dt;

    if (vel.length() < restSpeed) {
        bool const wasMoving = vel.x != 0.0 || vel.y != 0.0;
        vel = Components::Velocity(0.0, 0.0);
        return wasMoving;
    }
    return false;
}

void MovementSystem::update(entt::registry &registry, double dt) {
    PROFILE_SCOPE("MovementSystem");

    auto view = registry.view<Components::Position,
                              Components::PreviousPosition,
                              Components::Velocity,
                              Components::Friction>();

    for (auto [entity, pos, prev, vel, friction] : view.each()) {
        if (integrate(pos, prev, vel, friction.value, dt, specificConfig.restSpeedThreshold)) {
            CollisionStats::recordRestStop();
            DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "Ball at rest at (" << pos.x << ", " << pos.y << ")\n");
        }
    }
}

} // namespace Systems
