#include <gtest/gtest.h>
#include <stdexcept>
#include "minigolf/components/basic.hpp"
#include "minigolf/systems/movement.hpp"

using namespace Systems;

class MovementTest : public ::testing::Test {
protected:
    entt::registry registry;

    entt::entity createBody(double x, double y, double vx, double vy, double friction) {
        auto entity = registry.create();
        registry.emplace<Components::Position>(entity, x, y);
        registry.emplace<Components::PreviousPosition>(entity, Position(x, y));
        registry.emplace<Components::Velocity>(entity, vx, vy);
        registry.emplace<Components::Friction>(entity, friction);
        return entity;
    }
};

TEST_F(MovementTest, IntegratesPositionAndDampsVelocity) {
    Components::Position pos(0.0, 0.0);
    Components::PreviousPosition prev{Position(-1.0, -1.0)};
    Components::Velocity vel(60.0, 0.0);

    MovementSystem::integrate(pos, prev, vel, 0.85, 1.0 / 60.0);

    EXPECT_DOUBLE_EQ(prev.value.x, 0.0);
    EXPECT_DOUBLE_EQ(prev.value.y, 0.0);
    EXPECT_DOUBLE_EQ(pos.x, 1.0);
    EXPECT_DOUBLE_EQ(pos.y, 0.0);
    EXPECT_DOUBLE_EQ(vel.x, 60.0 * (1.0 - (1.0 - 0.85) * (1.0 / 60.0)));
    EXPECT_DOUBLE_EQ(vel.y, 0.0);
}

TEST_F(MovementTest, PreviousPositionIsCapturedBeforeMoving) {
    Components::Position pos(10.0, 20.0);
    Components::PreviousPosition prev{Position(0.0, 0.0)};
    Components::Velocity vel(100.0, -50.0);

    MovementSystem::integrate(pos, prev, vel, 0.9, 0.1);

    EXPECT_DOUBLE_EQ(prev.value.x, 10.0);
    EXPECT_DOUBLE_EQ(prev.value.y, 20.0);
    EXPECT_DOUBLE_EQ(pos.x, 20.0);
    EXPECT_DOUBLE_EQ(pos.y, 15.0);
}

TEST_F(MovementTest, SlowBodySnapsToRest) {
    Components::Position pos(5.0, 5.0);
    Components::PreviousPosition prev{pos};
    Components::Velocity vel(0.05, 0.05);

    bool const stopped = MovementSystem::integrate(pos, prev, vel, 0.85, 1.0 / 60.0);

    EXPECT_TRUE(stopped);
    EXPECT_EQ(vel.x, 0.0);
    EXPECT_EQ(vel.y, 0.0);
    // Still moved by the pre-damping velocity this tick
    EXPECT_GT(pos.x, 5.0);
}

TEST_F(MovementTest, RestingBodyStaysPut) {
    Components::Position pos(5.0, 5.0);
    Components::PreviousPosition prev{pos};
    Components::Velocity vel(0.0, 0.0);

    for (int i = 0; i < 10; ++i) {
        EXPECT_FALSE(MovementSystem::integrate(pos, prev, vel, 0.85, 1.0 / 60.0));
    }
    EXPECT_DOUBLE_EQ(pos.x, 5.0);
    EXPECT_DOUBLE_EQ(pos.y, 5.0);
}

TEST_F(MovementTest, RejectsNonPositiveDtWithoutMutation) {
    Components::Position pos(1.0, 2.0);
    Components::PreviousPosition prev{Position(0.0, 0.0)};
    Components::Velocity vel(10.0, 10.0);

    EXPECT_THROW(MovementSystem::integrate(pos, prev, vel, 0.85, 0.0), std::invalid_argument);
    EXPECT_THROW(MovementSystem::integrate(pos, prev, vel, 0.85, -0.1), std::invalid_argument);

    EXPECT_DOUBLE_EQ(pos.x, 1.0);
    EXPECT_DOUBLE_EQ(prev.value.x, 0.0);
    EXPECT_DOUBLE_EQ(vel.x, 10.0);
}

TEST_F(MovementTest, SystemUpdatesEveryBodyWithFriction) {
    auto body = createBody(0.0, 0.0, 30.0, 0.0, 0.5);

    // Entity without friction is not integrated
    auto inert = registry.create();
    registry.emplace<Components::Position>(inert, 1.0, 1.0);
    registry.emplace<Components::Velocity>(inert, 30.0, 0.0);

    MovementSystem system;
    system.update(registry, 0.5);

    auto &pos = registry.get<Components::Position>(body);
    auto &vel = registry.get<Components::Velocity>(body);
    EXPECT_DOUBLE_EQ(pos.x, 15.0);
    EXPECT_DOUBLE_EQ(vel.x, 30.0 * (1.0 - 0.5 * 0.5));

    EXPECT_DOUBLE_EQ(registry.get<Components::Position>(inert).x, 1.0);
}

TEST_F(MovementTest, RestThresholdIsConfigurable) {
    auto body = createBody(0.0, 0.0, 5.0, 0.0, 1.0);

    MovementSystem system;
    MovementConfig cfg;
    cfg.restSpeedThreshold = 10.0;
    system.setSpecificConfig(cfg);
    system.update(registry, 0.1);

    EXPECT_EQ(registry.get<Components::Velocity>(body).x, 0.0);
}
