/**
 * @file main.cpp
 * @brief Headless demo: plays every built-in course with scripted shots.
 *
 * Each shot aims straight at the first hole. The simulator is ticked at the
 * course's fixed rate until the ball stops or drops, then the next shot is
 * taken, up to a shot limit per course.
 */

#include <iostream>

#include "minigolf/components/course.hpp"
#include "minigolf/core/course_manager.hpp"
#include "minigolf/core/debug.hpp"
#include "minigolf/core/profile.hpp"
#include "minigolf/core/simulator.hpp"

namespace {

constexpr int MaxShotsPerCourse = 10;
constexpr int MaxTicksPerShot = 60 * 30;  // 30 seconds at 60 Hz

Position firstHoleCenter(const entt::registry &registry) {
    auto holes = registry.view<Components::Hole, Components::Position>();
    if (holes.begin() == holes.end()) {
        return Position();
    }
    return holes.get<Components::Position>(*holes.begin());
}

void playCourse(ECSSimulator &simulator) {
    simulator.reset();
    Position const cup = firstHoleCenter(simulator.getRegistry());

    bool holed = false;
    simulator.setHoleCallback([&holed](const Components::GameState &) { holed = true; });

    for (int shot = 0; shot < MaxShotsPerCourse && !holed; ++shot) {
        if (!simulator.shootTowards(cup)) {
            break;
        }
        for (int i = 0; i < MaxTicksPerShot && !holed; ++i) {
            simulator.tick();
            if (simulator.ballAtRest()) {
                break;
            }
        }

        const auto &pos = simulator.getRegistry().get<Components::Position>(simulator.getBall());
        std::cout << "  shot " << (shot + 1) << ": ball at (" << pos.x << ", " << pos.y << ")\n";
    }

    const auto &state = simulator.getGameState();
    std::cout << state.courseName << "\n"
              << "  Total Shots: " << state.totalShots << "\n"
              << "  Current Hole Shots: " << state.shotsSinceLastHole << "\n"
              << "  Last Hole: " << state.shotsNeededLastHole << "\n";
}

} // namespace

int main() {
    PROFILE_SCOPE("main");

    CourseManager courseManager;
    courseManager.buildCourseList();

    ECSSimulator simulator;
    for (const auto &[type, name] : courseManager.getCourseList()) {
        std::cout << "=== " << name << " ===" << std::endl;
        courseManager.setCurrentCourse(type);
        simulator.loadCourse(courseManager.createCourse(type));
        CollisionStats::reset();
        playCourse(simulator);
        CollisionStats::printStats();
    }

    Profiling::Profiler::printStats();
    return 0;
}
