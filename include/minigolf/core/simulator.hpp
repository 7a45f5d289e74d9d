/**
 * @file simulator.hpp
 * @brief Main simulator class that manages an ECS registry and course lifecycle.
 */

#pragma once

#include <functional>
#include <memory>
#include <vector>

#include <entt/entt.hpp>

#include "minigolf/components/basic.hpp"
#include "minigolf/components/game.hpp"
#include "minigolf/core/system_config.hpp"
#include "minigolf/courses/i_course.hpp"
#include "minigolf/systems/i_system.hpp"

/**
 * @class ECSSimulator
 * @brief Owns the registry for one course and steps its systems.
 *
 * Every tick runs, in this order: movement, obstacle collision, boundary
 * collision, hole check. Obstacles are resolved before the boundary so a
 * ball pushed off an obstacle and through a wall is corrected in the same
 * tick.
 */
class ECSSimulator {
public:
    /**
     * @brief Called after the shot counters are updated for a holed ball,
     *        before the ball is returned to the tee.
     */
    using HoleCallback = std::function<void(const Components::GameState &)>;

    ECSSimulator();
    ~ECSSimulator();

    /**
     * @brief Queues the course to play. It replaces the current course
     *        only when the next reset() succeeds; if that reset() throws,
     *        the queued course is discarded.
     */
    void loadCourse(std::unique_ptr<ICourse> course);

    /**
     * @brief Rebuilds the registry from the loaded course and resets the shot counters
     *
     * @throws std::runtime_error if no course is loaded
     * @throws std::invalid_argument if the course fails validation; the
     *         previous registry is left untouched
     */
    void reset();

    /**
     * @brief Steps the ECS systems for one tick of the configured length
     */
    void tick();

    /**
     * @brief Steps the ECS systems for one tick of length dt
     *
     * @throws std::invalid_argument if dt is not positive and finite
     * @throws std::runtime_error if no course has been spawned
     */
    void tick(double dt);

    /**
     * @brief Sets the ball velocity from a shot
     *
     * The speed is magnitude clamped to [0, MaxShootStrength]. A zero
     * direction is ignored.
     *
     * @return true if the shot was taken and counted
     */
    bool applyShot(const Vector &direction, double magnitude);

    /**
     * @brief Shoots the ball toward a point, scaled by distance
     *
     * Speed is |target - ball| * ShootStrength, capped at MaxShootStrength.
     *
     * @return true if the shot was taken and counted
     */
    bool shootTowards(const Position &target);

    void setHoleCallback(HoleCallback callback);

    /** @brief True when the ball's velocity is exactly zero */
    bool ballAtRest() const;

    entt::entity getBall() const { return ball; }
    const Components::GameState &getGameState() const;
    const SystemConfig &getConfig() const { return currentConfig; }

    entt::registry &getRegistry() { return registry; }
    const entt::registry &getRegistry() const { return registry; }

    /** @brief The course the current registry was spawned from */
    ICourse &getCurrentCourse() const;

private:
    void createSystems();
    void onBallHoled();
    void requireBall() const;

    entt::registry registry;
    std::unique_ptr<ICourse> coursePtr;
    std::unique_ptr<ICourse> pendingCourse;
    SystemConfig currentConfig;
    std::vector<std::unique_ptr<Systems::ISystem>> systems;

    entt::entity ball = entt::null;
    entt::entity stateEntity = entt::null;
    HoleCallback holeCallback;
};
