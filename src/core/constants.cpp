#include "minigolf/core/constants.hpp"
#include <vector>

namespace SimulatorConstants {

    const unsigned int StepsPerSecond = 60;

    const double ShootStrength    = 20.0;
    const double MaxShootStrength = 600.0;

    const double RestSpeedThreshold = 0.1;

    const double StationaryDisplacementSq = 1e-8;
    const double SeparationSlop           = 1.0001;

    std::vector<CourseType> getAllCourses() {
        return {
            CourseType::SIMPLE_COURSE,
            CourseType::BUMPER_COURSE
        };
    }

    std::string getCourseName(CourseType course) {
        switch (course) {
            case CourseType::SIMPLE_COURSE: return "SIMPLE_COURSE";
            case CourseType::BUMPER_COURSE: return "BUMPER_COURSE";
            default: return "UNKNOWN";
        }
    }

} // namespace SimulatorConstants
