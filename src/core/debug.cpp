#include "minigolf/core/debug.hpp"

// Initialize static members
int CollisionStats::boundary_hits = 0;
int CollisionStats::obstacle_hits = 0;
int CollisionStats::holes = 0;
int CollisionStats::rest_stops = 0;
