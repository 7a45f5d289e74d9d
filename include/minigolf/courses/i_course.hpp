#ifndef MINIGOLF_I_COURSE_HPP
#define MINIGOLF_I_COURSE_HPP

#include <entt/entt.hpp>
#include "minigolf/core/system_config.hpp"
#include "minigolf/courses/course_description.hpp"

/**
 * @brief Abstract base class for any playable course
 *
 * Each course must provide:
 *  - getConfig() returning the SystemConfig to simulate it with
 *  - getDescription() returning its geometry and ball parameters
 *  - createEntities() that spawns all ECS entities
 */
class ICourse {
public:
    virtual ~ICourse() = default;

    /**
     * @brief Returns simulation configuration (tick length, shot strength, active systems)
     */
    virtual SystemConfig getConfig() const = 0;

    /**
     * @brief Returns the course geometry and ball parameters
     */
    virtual CourseDescription getDescription() const = 0;

    /**
     * @brief Creates course-specific entities in the registry
     * @return The ball entity
     */
    virtual entt::entity createEntities(entt::registry &registry) const = 0;
};

#endif // MINIGOLF_I_COURSE_HPP
