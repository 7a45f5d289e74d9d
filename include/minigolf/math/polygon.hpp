/**
 * @file polygon.hpp
 * @brief Polygon primitive shared by the course boundary and polygon obstacles
 *
 * Vertices are stored in world space. Edges are implied between
 * consecutive vertices, wrapping from the last vertex back to the first.
 * No winding order is assumed.
 */

#ifndef MINIGOLF_POLYGON_HPP
#define MINIGOLF_POLYGON_HPP

#include <cstddef>
#include <utility>
#include <vector>

#include "minigolf/math/vector_math.hpp"

/**
 * @brief Represents a closed polygon in 2D space
 */
struct PolygonShape {
    std::vector<Vector> vertices;       ///< Vertices in world coordinates

    /** @brief Number of edges, equal to the vertex count for a closed loop */
    std::size_t edgeCount() const { return vertices.size(); }

    /**
     * @brief Returns the endpoints of edge i
     *
     * Edge i runs from vertex i to vertex (i + 1) modulo the vertex count.
     *
     * @param i Edge index in [0, edgeCount())
     * @return Pair of (start, end) vertices
     */
    std::pair<Vector, Vector> edge(std::size_t i) const {
        return {vertices[i], vertices[(i + 1) % vertices.size()]};
    }
};

#endif // MINIGOLF_POLYGON_HPP
