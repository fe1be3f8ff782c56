#include "demo/Scenarios.hpp"

#include "core/BowlingGame.hpp"

#include <algorithm>
#include <cctype>

namespace bowling::demo {

namespace {
    bool equalsIgnoreCase(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) return false;
        return std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x))
                == std::tolower(static_cast<unsigned char>(y));
        });
    }
}

const std::vector<Scenario>& builtinScenarios() {
    static const std::vector<Scenario> scenarios{
        // X | 3 6 | 5 / | 8 1 | X | X | X | 9 0 | 7 / | X X 8
        {"Example Game",
         {10, 3, 6, 5, 5, 8, 1, 10, 10, 10, 9, 0, 7, 3, 10, 10, 8},
         190},
        {"Perfect Game", std::vector<int>(12, 10), 300},
        {"All Spares Game", std::vector<int>(21, 5), 150},
        {"Gutter Game", std::vector<int>(20, 0), 0},
        {"Regular Game",
         {3, 4, 2, 5, 1, 6, 4, 2, 8, 1, 7, 1, 5, 3, 2, 3, 4, 3, 2, 6},
         72},
    };
    return scenarios;
}

const Scenario* findScenario(const std::string& name) {
    const auto& all = builtinScenarios();
    auto it = std::find_if(all.begin(), all.end(), [&](const Scenario& s) {
        return equalsIgnoreCase(s.name, name);
    });
    return it != all.end() ? &*it : nullptr;
}

ScenarioResult playScenario(const Scenario& scenario, const RollObserver& onRoll) {
    core::BowlingGame game;
    for (int pins : scenario.rolls) {
        game.roll(pins);
        if (onRoll) onRoll(game.rollCount(), pins, game.score());
    }

    ScenarioResult result;
    result.name = scenario.name;
    result.rolls = scenario.rolls;
    result.expectedScore = scenario.expectedScore;
    result.actualScore = game.score();
    result.passed = result.actualScore == result.expectedScore;
    return result;
}

} // namespace bowling::demo
