/**
 * @file bumper_course.hpp
 * @brief Declaration of the BumperCourse class
 */

#pragma once

#include <entt/entt.hpp>
#include "minigolf/courses/i_course.hpp"

/**
 * @struct BumperCourseConfig
 * @brief Tunables for the bumper course layout
 */
struct BumperCourseConfig {
    int bumperCount = 3;               // Bumpers placed on the diagonal between tee and hole
    double bumperRadius = 28.0;
    double bumperDamping = 0.9;        // Bumpers are lively
    double wallDamping = 0.7;
    double holeRadius = 15.0;
    double ballFriction = 0.8;
    double ballRadius = 8.0;
};

/**
 * @class BumperCourse
 *
 * An open square field with a cut corner, a diagonal line of bouncy
 * bumpers between the tee (bottom left) and the hole (top right), and a
 * decorative triangular island.
 */
class BumperCourse : public ICourse {
public:
    BumperCourse() = default;
    explicit BumperCourse(const BumperCourseConfig &config) : courseConfig(config) {}
    ~BumperCourse() override = default;

    SystemConfig getConfig() const override;
    CourseDescription getDescription() const override;
    entt::entity createEntities(entt::registry &registry) const override;

private:
    BumperCourseConfig courseConfig;
};
