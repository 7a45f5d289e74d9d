/**
 * @file course_description.hpp
 * @brief Plain data describing a course, plus validation and entity spawning
 */

#pragma once

#include <string>
#include <vector>

#include <entt/entt.hpp>

#include "minigolf/components/basic.hpp"

/**
 * @struct ObstacleDescription
 * @brief One static obstacle of a course
 *
 * type is "circle" or "polygon". Circles use center and radius; polygons
 * use vertices. damping is the velocity multiplier applied on contact.
 */
struct ObstacleDescription {
    std::string type = "circle";
    Position center;
    double radius = 0.0;
    double damping = 1.0;
    std::vector<Vector> vertices;
    Components::Color color{128, 40, 20};
};

/**
 * @struct HoleDescription
 * @brief One goal region of a course
 */
struct HoleDescription {
    Position center;
    double radius = 0.0;
};

/**
 * @struct CourseDescription
 * @brief Everything needed to spawn a playable course
 */
struct CourseDescription {
    std::string name;

    std::vector<Vector> boundary;      // closed loop, at least 3 vertices
    double boundaryDamping = 0.6;

    std::vector<ObstacleDescription> obstacles;
    std::vector<HoleDescription> holes;

    Position ballStart;
    double ballFriction = 0.85;
    double ballRadius = 8.0;

    Components::Color backgroundColor{50, 50, 50};
    Components::Color courseColor{40, 65, 10};
    Components::Color courseStrokeColor{20, 35, 5};
    Components::Color ballColor{192, 192, 192};
    Components::Color holeColor{0, 0, 0};
};

/**
 * @brief Checks a course for geometry the kernel cannot simulate
 *
 * Rejects boundaries or polygon obstacles with fewer than 3 vertices,
 * non-finite coordinates, radii or friction that are not positive and
 * finite, damping that is negative or non-finite, and unknown obstacle
 * type tags.
 *
 * @throws std::invalid_argument describing the first problem found
 */
void validateCourse(const CourseDescription &course);

/**
 * @brief Validates a course and creates its entities
 *
 * Creates the boundary, one entity per obstacle (in list order), one per
 * hole, and the ball at rest on its start position. Nothing is created if
 * validation fails.
 *
 * @return The ball entity
 * @throws std::invalid_argument if the course is invalid
 */
entt::entity spawnCourse(entt::registry &registry, const CourseDescription &course);
