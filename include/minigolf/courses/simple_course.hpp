/**
 * @file simple_course.hpp
 * @brief Declaration of the SimpleCourse class
 */

#pragma once

#include <entt/entt.hpp>
#include "minigolf/courses/i_course.hpp"

/**
 * @class SimpleCourse
 *
 * A single-hole course: an L-shaped fairway with a notch cut into the top
 * wall, one round bumper between the tee and the dog-leg, and the hole in
 * the right-hand pocket.
 */
class SimpleCourse : public ICourse {
public:
    SimpleCourse() = default;
    ~SimpleCourse() override = default;

    SystemConfig getConfig() const override;
    CourseDescription getDescription() const override;
    entt::entity createEntities(entt::registry &registry) const override;
};
