/**
 * @file simple_course.cpp
 * @brief The default single-hole course.
 */

#include "minigolf/courses/simple_course.hpp"
#include "minigolf/core/constants.hpp"

SystemConfig SimpleCourse::getConfig() const {
  SystemConfig cfg;
  cfg.SecondsPerTick = 1.0 / SimulatorConstants::StepsPerSecond;
  cfg.ShootStrength = SimulatorConstants::ShootStrength;
  cfg.MaxShootStrength = SimulatorConstants::MaxShootStrength;
  cfg.activeSystems = {
      Systems::SystemType::MOVEMENT,
      Systems::SystemType::OBSTACLE_COLLISION,
      Systems::SystemType::BOUNDARY,
      Systems::SystemType::HOLE,
  };
  return cfg;
}

CourseDescription SimpleCourse::getDescription() const {
  CourseDescription course;
  course.name = "Simple Course";

  course.boundary = {
      {100, 100}, {500, 100}, {500, 250}, {600, 250}, {600, 100}, {700, 100},
      {700, 500}, {600, 500}, {450, 400}, {450, 300}, {100, 300},
  };
  course.boundaryDamping = 0.6;

  ObstacleDescription bumper;
  bumper.type = "circle";
  bumper.center = Position(400, 200);
  bumper.radius = 50;
  bumper.damping = 0.25;
  bumper.color = Components::Color(128, 40, 20);
  course.obstacles.push_back(bumper);

  course.holes.push_back({Position(650, 200), 15});

  course.ballStart = Position(200, 200);
  course.ballFriction = 0.85;
  course.ballRadius = 8.0;

  course.backgroundColor = Components::Color(50, 50, 50);
  course.courseColor = Components::Color(40, 65, 10);
  course.ballColor = Components::Color(192, 192, 192);
  course.holeColor = Components::Color(0, 0, 0);

  return course;
}

entt::entity SimpleCourse::createEntities(entt::registry &registry) const {
  return spawnCourse(registry, getDescription());
}
