/**
 * @file course_description.cpp
 * @brief Validation of course data and creation of course entities.
 */

#include "minigolf/courses/course_description.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include "minigolf/components/course.hpp"
#include "minigolf/math/polygon.hpp"

using ObstacleMaker = void (*)(entt::registry &, const ObstacleDescription &, std::size_t);

static void requirePositiveFinite(double value, const std::string &what) {
  if (!(value > 0.0) || !std::isfinite(value)) {
    std::ostringstream msg;
    msg << what << " must be positive and finite, got " << value;
    throw std::invalid_argument(msg.str());
  }
}

static void requireDamping(double value, const std::string &what) {
  if (!(value >= 0.0) || !std::isfinite(value)) {
    std::ostringstream msg;
    msg << what << " must be non-negative and finite, got " << value;
    throw std::invalid_argument(msg.str());
  }
}

static void requireFinitePoint(double x, double y, const std::string &what) {
  if (!std::isfinite(x) || !std::isfinite(y)) {
    throw std::invalid_argument(what + " has a non-finite coordinate");
  }
}

static void requireLoop(const std::vector<Vector> &vertices, const std::string &what) {
  if (vertices.size() < 3) {
    std::ostringstream msg;
    msg << what << " needs at least 3 vertices, got " << vertices.size();
    throw std::invalid_argument(msg.str());
  }
  for (const auto &v : vertices) {
    requireFinitePoint(v.x, v.y, what);
  }
}

/**
 * @brief Creates a static circular obstacle.
 */
static void makeCircleObstacle(entt::registry &registry,
                               const ObstacleDescription &desc,
                               std::size_t order) {
  auto ent = registry.create();
  registry.emplace<Components::Obstacle>(ent, desc.damping, order);
  registry.emplace<Components::Shape>(ent, Components::ShapeType::Circle, desc.radius);
  registry.emplace<Components::Position>(ent, desc.center.x, desc.center.y);
  registry.emplace<Components::Color>(ent, desc.color);
}

/**
 * @brief Creates a decorative polygon obstacle. It is drawn but never collides.
 */
static void makePolygonObstacle(entt::registry &registry,
                                const ObstacleDescription &desc,
                                std::size_t order) {
  auto ent = registry.create();
  registry.emplace<Components::Obstacle>(ent, desc.damping, order);
  registry.emplace<Components::Shape>(ent, Components::ShapeType::Polygon, 0.0);

  PolygonShape poly;
  poly.vertices = desc.vertices;
  registry.emplace<PolygonShape>(ent, poly);
  registry.emplace<Components::Color>(ent, desc.color);
}

// Obstacle type tag -> factory
static const std::unordered_map<std::string, ObstacleMaker> &obstacleMakers() {
  static const std::unordered_map<std::string, ObstacleMaker> makers = {
      {"circle", &makeCircleObstacle},
      {"polygon", &makePolygonObstacle},
  };
  return makers;
}

void validateCourse(const CourseDescription &course) {
  requireLoop(course.boundary, "Course boundary");
  requireDamping(course.boundaryDamping, "Boundary damping");

  requireFinitePoint(course.ballStart.x, course.ballStart.y, "Ball start");
  requirePositiveFinite(course.ballRadius, "Ball radius");
  requirePositiveFinite(course.ballFriction, "Ball friction");

  for (std::size_t i = 0; i < course.obstacles.size(); ++i) {
    const auto &obs = course.obstacles[i];
    std::string const label = "Obstacle " + std::to_string(i);

    if (obstacleMakers().count(obs.type) == 0) {
      throw std::invalid_argument(label + " has unknown type \"" + obs.type + "\"");
    }
    requireDamping(obs.damping, label + " damping");

    if (obs.type == "circle") {
      requireFinitePoint(obs.center.x, obs.center.y, label + " center");
      requirePositiveFinite(obs.radius, label + " radius");
    } else {
      requireLoop(obs.vertices, label);
    }
  }

  for (std::size_t i = 0; i < course.holes.size(); ++i) {
    const auto &hole = course.holes[i];
    std::string const label = "Hole " + std::to_string(i);
    requireFinitePoint(hole.center.x, hole.center.y, label + " center");
    requirePositiveFinite(hole.radius, label + " radius");
  }
}

entt::entity spawnCourse(entt::registry &registry, const CourseDescription &course) {
  validateCourse(course);

  // Course wall
  auto wall = registry.create();
  registry.emplace<Components::Boundary>(wall, course.boundaryDamping);
  PolygonShape boundary;
  boundary.vertices = course.boundary;
  registry.emplace<PolygonShape>(wall, boundary);
  registry.emplace<Components::Color>(wall, course.courseColor);

  for (std::size_t i = 0; i < course.obstacles.size(); ++i) {
    const auto &obs = course.obstacles[i];
    obstacleMakers().at(obs.type)(registry, obs, i);
  }
  // Views over Obstacle then iterate in course order
  registry.sort<Components::Obstacle>([](const auto &lhs, const auto &rhs) {
    return lhs.order < rhs.order;
  });

  for (const auto &hole : course.holes) {
    auto ent = registry.create();
    registry.emplace<Components::Hole>(ent);
    registry.emplace<Components::Position>(ent, hole.center.x, hole.center.y);
    registry.emplace<Components::Radius>(ent, hole.radius);
    registry.emplace<Components::Color>(ent, course.holeColor);
  }

  auto ball = registry.create();
  registry.emplace<Components::Ball>(ball);
  registry.emplace<Components::SpawnPoint>(ball, course.ballStart);
  registry.emplace<Components::Position>(ball, course.ballStart.x, course.ballStart.y);
  registry.emplace<Components::PreviousPosition>(ball, course.ballStart);
  registry.emplace<Components::Velocity>(ball, 0.0, 0.0);
  registry.emplace<Components::Radius>(ball, course.ballRadius);
  registry.emplace<Components::Friction>(ball, course.ballFriction);
  registry.emplace<Components::Color>(ball, course.ballColor);

  return ball;
}
