/**
 * @file course.hpp
 * @brief Tag and data components for the entities that make up a course
 *
 * A spawned course consists of:
 * - one ball: Ball, SpawnPoint, Position, PreviousPosition, Velocity, Radius, Friction
 * - one boundary: Boundary, PolygonShape
 * - any number of obstacles: Obstacle, Shape, Position (circles) or PolygonShape
 * - any number of holes: Hole, Position, Radius
 */

#pragma once

#include <cstddef>

#include "minigolf/math/vector_math.hpp"

namespace Components {

    // Marks the single moving body of the simulation
    struct Ball {};

    // Where the ball is placed when the course starts and after every hole
    struct SpawnPoint {
        ::Position value;
    };

    // Playfield wall; the polygon itself is stored in a PolygonShape
    struct Boundary {
        double damping;  // velocity multiplier applied on bounce
    };

    // Static obstacle; geometry comes from Shape (+ PolygonShape for polygons)
    struct Obstacle {
        double damping;
        std::size_t order;  // index in the course's obstacle list; collisions run in this order
    };

    struct Hole {};

} // namespace Components
