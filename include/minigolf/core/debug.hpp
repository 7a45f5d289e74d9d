#pragma once

#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#ifndef MINIGOLF_ENABLE_DEBUG
#define MINIGOLF_ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#define CURRENT_DEBUG_LEVEL DEBUG_LEVEL_BASIC

// Debug macros
#define DEBUG_MSG(level, x) do { \
    if (MINIGOLF_ENABLE_DEBUG && level <= CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Helper class for collecting collision counts between debug reports
class CollisionStats {
public:
    static void reset() {
        boundary_hits = 0;
        obstacle_hits = 0;
        holes = 0;
        rest_stops = 0;
    }

    static void recordBoundaryHit() { boundary_hits++; }
    static void recordObstacleHit() { obstacle_hits++; }
    static void recordHole() { holes++; }
    static void recordRestStop() { rest_stops++; }

    static int boundaryHits() { return boundary_hits; }
    static int obstacleHits() { return obstacle_hits; }
    static int holeCount() { return holes; }
    static int restStops() { return rest_stops; }

    static void printStats() {
        DEBUG_MSG(DEBUG_LEVEL_BASIC,
            "Collision stats:\n"
            "  Boundary bounces: " << boundary_hits << "\n"
            "  Obstacle bounces: " << obstacle_hits << "\n"
            "  Holes: " << holes << "\n"
            "  Rest stops: " << rest_stops << "\n"
        );
    }

private:
    static int boundary_hits;
    static int obstacle_hits;
    static int holes;
    static int rest_stops;
};
