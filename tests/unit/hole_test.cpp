#include <gtest/gtest.h>
#include "minigolf/components/basic.hpp"
#include "minigolf/components/course.hpp"
#include "minigolf/systems/hole.hpp"

using namespace Systems;

class HoleTest : public ::testing::Test {
protected:
    entt::registry registry;

    entt::entity createHole(double x, double y, double radius) {
        auto hole = registry.create();
        registry.emplace<Components::Hole>(hole);
        registry.emplace<Components::Position>(hole, x, y);
        registry.emplace<Components::Radius>(hole, radius);
        return hole;
    }

    entt::entity createBall(double x, double y, double vx, double vy) {
        auto ball = registry.create();
        registry.emplace<Components::Ball>(ball);
        registry.emplace<Components::SpawnPoint>(ball, Position(200.0, 200.0));
        registry.emplace<Components::Position>(ball, x, y);
        registry.emplace<Components::PreviousPosition>(ball, Position(x - 5.0, y));
        registry.emplace<Components::Velocity>(ball, vx, vy);
        registry.emplace<Components::Radius>(ball, 8.0);
        return ball;
    }
};

TEST_F(HoleTest, ContainmentIsStrict) {
    Components::Position const cup(650.0, 200.0);

    EXPECT_TRUE(HoleSystem::containsBall(cup, 15.0, Components::Position(650.0, 200.0)));
    EXPECT_TRUE(HoleSystem::containsBall(cup, 15.0, Components::Position(660.0, 205.0)));
    EXPECT_FALSE(HoleSystem::containsBall(cup, 15.0, Components::Position(665.0, 200.0)));  // exactly on the rim
    EXPECT_FALSE(HoleSystem::containsBall(cup, 15.0, Components::Position(700.0, 200.0)));
}

TEST_F(HoleTest, HoledBallFiresCallbackOnceAndRespawns) {
    auto hole = createHole(650.0, 200.0, 15.0);
    auto ball = createBall(648.0, 203.0, 120.0, 0.0);

    int calls = 0;
    entt::entity reportedHole = entt::null;
    Position positionSeenByCallback;

    HoleSystem system;
    system.setHoleCallback([&](entt::registry &reg, entt::entity h, entt::entity b) {
        ++calls;
        reportedHole = h;
        positionSeenByCallback = reg.get<Components::Position>(b);
    });
    system.update(registry, 1.0 / 60.0);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(reportedHole, hole);
    // Callback runs before the reset
    EXPECT_DOUBLE_EQ(positionSeenByCallback.x, 648.0);

    const auto &pos = registry.get<Components::Position>(ball);
    const auto &vel = registry.get<Components::Velocity>(ball);
    const auto &prev = registry.get<Components::PreviousPosition>(ball);
    EXPECT_DOUBLE_EQ(pos.x, 200.0);
    EXPECT_DOUBLE_EQ(pos.y, 200.0);
    EXPECT_EQ(vel.x, 0.0);
    EXPECT_EQ(vel.y, 0.0);
    EXPECT_DOUBLE_EQ(prev.value.x, 200.0);

    // Ball is back on the tee; nothing further happens
    system.update(registry, 1.0 / 60.0);
    EXPECT_EQ(calls, 1);
}

TEST_F(HoleTest, BallOutsideHoleIsUntouched) {
    createHole(650.0, 200.0, 15.0);
    auto ball = createBall(400.0, 200.0, 50.0, 0.0);

    int calls = 0;
    HoleSystem system;
    system.setHoleCallback([&](entt::registry &, entt::entity, entt::entity) { ++calls; });
    system.update(registry, 1.0 / 60.0);

    EXPECT_EQ(calls, 0);
    EXPECT_DOUBLE_EQ(registry.get<Components::Position>(ball).x, 400.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::Velocity>(ball).x, 50.0);
}

TEST_F(HoleTest, RespawnsWithoutCallback) {
    createHole(650.0, 200.0, 15.0);
    auto ball = createBall(650.0, 200.0, 10.0, 10.0);

    HoleSystem system;
    system.update(registry, 1.0 / 60.0);

    EXPECT_DOUBLE_EQ(registry.get<Components::Position>(ball).x, 200.0);
    EXPECT_EQ(registry.get<Components::Velocity>(ball).x, 0.0);
}
