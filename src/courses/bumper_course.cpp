/**
 * @file bumper_course.cpp
 * @brief A field of bumpers laid out on the diagonal between tee and hole.
 */

#include "minigolf/courses/bumper_course.hpp"
#include "minigolf/core/constants.hpp"

SystemConfig BumperCourse::getConfig() const {
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

CourseDescription BumperCourse::getDescription() const {
  CourseDescription course;
  course.name = "Bumper Field";

  // Square field, top-left corner cut at 45 degrees
  course.boundary = {
      {50, 150}, {150, 50}, {750, 50}, {750, 550}, {50, 550},
  };
  course.boundaryDamping = courseConfig.wallDamping;

  Position const tee(120, 480);
  Position const cup(680, 120);

  // Bumpers evenly spaced on the tee-to-cup diagonal, alternately nudged off it
  // so a straight shot always has to deflect at least once.
  for (int i = 0; i < courseConfig.bumperCount; ++i) {
    double const t = static_cast<double>(i + 1) / (courseConfig.bumperCount + 1);
    double const offset = (i % 2 == 0) ? 12.0 : -12.0;

    ObstacleDescription bumper;
    bumper.type = "circle";
    bumper.center = Position(tee.x + (cup.x - tee.x) * t + offset,
                             tee.y + (cup.y - tee.y) * t + offset);
    bumper.radius = courseConfig.bumperRadius;
    bumper.damping = courseConfig.bumperDamping;
    bumper.color = Components::Color(200, 60, 40);
    course.obstacles.push_back(bumper);
  }

  ObstacleDescription island;
  island.type = "polygon";
  island.vertices = {{520, 420}, {640, 420}, {580, 500}};
  island.damping = 1.0;
  island.color = Components::Color(0, 200, 0);
  course.obstacles.push_back(island);

  course.holes.push_back({cup, courseConfig.holeRadius});

  course.ballStart = tee;
  course.ballFriction = courseConfig.ballFriction;
  course.ballRadius = courseConfig.ballRadius;

  course.courseColor = Components::Color(30, 90, 30);
  course.courseStrokeColor = Components::Color(15, 45, 15);

  return course;
}

entt::entity BumperCourse::createEntities(entt::registry &registry) const {
  return spawnCourse(registry, getDescription());
}
