#ifndef MINIGOLF_CONSTANTS_HPP
#define MINIGOLF_CONSTANTS_HPP

#include <string>
#include <vector>

namespace SimulatorConstants {

    /**
     * @brief The built-in courses.
     */
    enum class CourseType {
        SIMPLE_COURSE,
        BUMPER_COURSE
    };

    extern const unsigned int StepsPerSecond;

    // Shot defaults
    extern const double ShootStrength;     // speed per unit of aim distance
    extern const double MaxShootStrength;  // units per second

    // Integration
    extern const double RestSpeedThreshold;  // below this the ball is stopped

    // Swept collision
    extern const double StationaryDisplacementSq;  // |d|^2 below this is treated as no motion
    extern const double SeparationSlop;            // multiplier keeping the ball off the obstacle

    std::vector<CourseType> getAllCourses();
    std::string getCourseName(CourseType course);
}

#endif // MINIGOLF_CONSTANTS_HPP
