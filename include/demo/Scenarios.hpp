#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace bowling::demo {

// A canned game with the score it should produce
struct Scenario {
    std::string name;
    std::vector<int> rolls;
    int expectedScore{0};
};

struct ScenarioResult {
    std::string name;
    std::vector<int> rolls;
    int expectedScore{0};
    int actualScore{0};
    bool passed{false};
};

// Example, perfect, all-spares, gutter and regular games, in that order
const std::vector<Scenario>& builtinScenarios();

// Case-insensitive lookup by name; nullptr if unknown
const Scenario* findScenario(const std::string& name);

// Called after each recorded roll with its 1-based number, pins and running score
using RollObserver = std::function<void(std::size_t rollNumber, int pins, int scoreSoFar)>;

// Plays the rolls on a fresh game. Throws core::InvalidRollError on a bad roll.
ScenarioResult playScenario(const Scenario& scenario, const RollObserver& onRoll = {});

} // namespace bowling::demo
