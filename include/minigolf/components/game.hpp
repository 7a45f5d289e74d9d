#pragma once

#include <string>
#include <utility>

namespace Components {
    // Shot counters for the active course. One instance lives in the registry.
    struct GameState {
        std::string courseName;
        int totalShots = 0;
        int shotsSinceLastHole = 0;
        int shotsNeededLastHole = 0;
        int holesCompleted = 0;

        GameState() = default;
        explicit GameState(std::string name)
            : courseName(std::move(name)) {}
    };
}
