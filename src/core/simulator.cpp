/**
 * @fileoverview simulator.cpp
 * @brief Implementation of ECSSimulator.
 */

#include "minigolf/core/simulator.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "minigolf/core/profile.hpp"
#include "minigolf/systems/boundary.hpp"
#include "minigolf/systems/hole.hpp"
#include "minigolf/systems/movement.hpp"
#include "minigolf/systems/obstacle_collision.hpp"

ECSSimulator::ECSSimulator() = default;

ECSSimulator::~ECSSimulator() = default;

void ECSSimulator::loadCourse(std::unique_ptr<ICourse> course) {
  pendingCourse = std::move(course);
}

void ECSSimulator::reset() {
  // A queued course only becomes current once it has been spawned
  std::unique_ptr<ICourse> next = std::move(pendingCourse);
  ICourse* course = next ? next.get() : coursePtr.get();
  if (!course) {
    throw std::runtime_error("ECSSimulator::reset() called with no course loaded");
  }

  // Validate before touching the current registry
  CourseDescription const description = course->getDescription();
  validateCourse(description);

  registry.clear();

  stateEntity = registry.create();
  registry.emplace<Components::GameState>(stateEntity, description.name);

  ball = course->createEntities(registry);

  currentConfig = course->getConfig();
  createSystems();

  if (next) {
    coursePtr = std::move(next);
  }

  std::cout << "ECSSimulator::reset() loaded \"" << description.name << "\"" << std::endl;
}

void ECSSimulator::createSystems() {
  systems.clear();

  const auto& active = currentConfig.activeSystems;
  auto enabled = [&active](Systems::SystemType type) {
    return std::find(active.begin(), active.end(), type) != active.end();
  };

  // Fixed tick order, whatever order the course lists them in
  if (enabled(Systems::SystemType::MOVEMENT)) {
    systems.push_back(std::make_unique<Systems::MovementSystem>());
  }
  if (enabled(Systems::SystemType::OBSTACLE_COLLISION)) {
    systems.push_back(std::make_unique<Systems::ObstacleCollisionSystem>());
  }
  if (enabled(Systems::SystemType::BOUNDARY)) {
    systems.push_back(std::make_unique<Systems::BoundarySystem>());
  }
  if (enabled(Systems::SystemType::HOLE)) {
    auto holeSystem = std::make_unique<Systems::HoleSystem>();
    holeSystem->setHoleCallback([this](entt::registry&, entt::entity, entt::entity) {
      onBallHoled();
    });
    systems.push_back(std::move(holeSystem));
  }
}

void ECSSimulator::requireBall() const {
  if (ball == entt::null || !registry.valid(ball)) {
    throw std::runtime_error("ECSSimulator: no course has been spawned, call reset() first");
  }
}

void ECSSimulator::tick() {
  tick(currentConfig.SecondsPerTick);
}

void ECSSimulator::tick(double dt) {
  if (!(dt > 0.0) || !std::isfinite(dt)) {
    throw std::invalid_argument("ECSSimulator::tick: dt must be positive and finite, got " +
                                std::to_string(dt));
  }
  requireBall();

  PROFILE_SCOPE("ECSSimulator::tick");

  for (auto& system : systems) {
    system->update(registry, dt);
  }
}

bool ECSSimulator::applyShot(const Vector& direction, double magnitude) {
  requireBall();
  if (!std::isfinite(magnitude)) {
    throw std::invalid_argument("ECSSimulator::applyShot: magnitude must be finite");
  }
  if (direction.lengthSquared() == 0.0) {
    return false;
  }

  double const strength = std::clamp(magnitude, 0.0, currentConfig.MaxShootStrength);
  registry.get<Components::Velocity>(ball) = direction.normalized() * strength;

  auto& state = registry.get<Components::GameState>(stateEntity);
  state.totalShots += 1;
  state.shotsSinceLastHole += 1;
  return true;
}

bool ECSSimulator::shootTowards(const Position& target) {
  requireBall();
  Vector const shot = target - registry.get<Components::Position>(ball);
  double const distance = shot.length();
  if (distance == 0.0) {
    return false;
  }
  double const strength = std::min(distance * currentConfig.ShootStrength,
                                   currentConfig.MaxShootStrength);
  return applyShot(shot, strength);
}

void ECSSimulator::setHoleCallback(HoleCallback callback) {
  holeCallback = std::move(callback);
}

void ECSSimulator::onBallHoled() {
  auto& state = registry.get<Components::GameState>(stateEntity);
  state.shotsNeededLastHole = state.shotsSinceLastHole;
  state.shotsSinceLastHole = 0;
  state.holesCompleted += 1;

  std::cout << "Ball in hole! (" << state.shotsNeededLastHole << " shots)" << std::endl;

  if (holeCallback) {
    holeCallback(state);
  }
}

bool ECSSimulator::ballAtRest() const {
  requireBall();
  const auto& vel = registry.get<Components::Velocity>(ball);
  return vel.x == 0.0 && vel.y == 0.0;
}

const Components::GameState& ECSSimulator::getGameState() const {
  if (stateEntity == entt::null || !registry.valid(stateEntity)) {
    throw std::runtime_error("ECSSimulator: no game state, call reset() first");
  }
  return registry.get<Components::GameState>(stateEntity);
}

ICourse& ECSSimulator::getCurrentCourse() const {
  if (!coursePtr) {
    throw std::runtime_error("ECSSimulator: no course loaded");
  }
  return *coursePtr;
}
