/**
 * @file i_system.hpp
 * @brief Interface for all ECS systems in the golf simulation
 */

#pragma once

#include <entt/entt.hpp>

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * Every stage of a simulation tick is a system. The simulator owns the
 * systems and calls update() on each of them in a fixed order.
 */
class ISystem {
public:
    /**
     * @brief Virtual destructor for proper cleanup of derived classes
     */
    virtual ~ISystem() = default;

    /**
     * @brief Updates the system for one simulation step
     *
     * @param registry EnTT registry containing all entities and components
     * @param dt Length of the step in seconds, always > 0
     */
    virtual void update(entt::registry& registry, double dt) = 0;
};

/**
 * @brief Template for system-specific configurations
 *
 * Derived systems that need tuning carry a SpecificConfig with its
 * own defaults.
 */
template<typename SpecificConfig>
class ConfigurableSystem : public ISystem {
protected:
    SpecificConfig specificConfig;

public:
    /**
     * @brief Sets the system-specific configuration
     *
     * @param config System-specific configuration parameters
     */
    void setSpecificConfig(const SpecificConfig& config) {
        specificConfig = config;
    }

    /**
     * @brief Gets the system-specific configuration
     *
     * @return Current system-specific configuration
     */
    const SpecificConfig& getSpecificConfig() const {
        return specificConfig;
    }
};

} // namespace Systems
