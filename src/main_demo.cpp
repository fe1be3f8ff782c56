#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/BowlingGame.hpp"
#include "demo/DemoConfig.hpp"
#include "demo/Scenarios.hpp"

using namespace bowling;

namespace {

void printRolls(const std::vector<int>& rolls) {
    std::cout << "Rolls: [";
    for (std::size_t i = 0; i < rolls.size(); ++i) {
        if (i > 0) std::cout << ", ";
        std::cout << rolls[i];
    }
    std::cout << "]\n";
}

void printResult(const demo::ScenarioResult& r) {
    printRolls(r.rolls);
    std::cout << "Expected score: " << r.expectedScore << '\n'
              << "Actual score: " << r.actualScore << '\n'
              << "Correct implementation: " << (r.passed ? "yes" : "no") << '\n';
}

void logRoll(const std::string& name, std::size_t rollNumber, int pins, int scoreSoFar) {
    std::cout << "[DEMO] " << name << ": roll " << rollNumber
              << " = " << pins << ", score so far " << scoreSoFar << '\n';
}

} // namespace

int main(int argc, char** argv) {
    demo::DemoConfig cfg;
    try {
        cfg = demo::parseDemoArgs(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << "[DEMO] " << e.what() << '\n'
                  << "Usage: " << argv[0]
                  << " [--list] [--verbose] [--scenario <name>]... [--rolls 10,3,6,...]\n";
        return 2;
    }

    if (cfg.listOnly) {
        for (const auto& s : demo::builtinScenarios()) {
            std::cout << s.name << '\n';
        }
        return 0;
    }

    std::vector<demo::Scenario> selected;
    if (!cfg.scenarioNames.empty()) {
        for (const auto& name : cfg.scenarioNames) {
            const demo::Scenario* s = demo::findScenario(name);
            if (!s) {
                std::cerr << "[DEMO] unknown scenario: " << name << '\n';
                return 2;
            }
            selected.push_back(*s);
        }
    } else if (!cfg.hasCustomRolls) {
        selected = demo::builtinScenarios();
    }

    std::cout << "BOWLING GAME EXAMPLES\n"
              << "=====================\n";

    bool allPassed = true;
    try {
        if (cfg.hasCustomRolls) {
            std::cout << "\nCustom Game:\n";

            core::BowlingGame game;
            for (int pins : cfg.customRolls) {
                game.roll(pins);
                if (cfg.verbose) logRoll("Custom Game", game.rollCount(), pins, game.score());
            }
            printRolls(game.rolls());
            std::cout << "Score: " << game.score() << '\n';
        }

        for (const auto& s : selected) {
            demo::RollObserver onRoll;
            if (cfg.verbose) {
                onRoll = [&s](std::size_t rollNumber, int pins, int scoreSoFar) {
                    logRoll(s.name, rollNumber, pins, scoreSoFar);
                };
            }

            std::cout << '\n' << s.name << ":\n";
            const demo::ScenarioResult r = demo::playScenario(s, onRoll);
            printResult(r);
            allPassed = allPassed && r.passed;
        }
    } catch (const core::InvalidRollError& e) {
        std::cerr << "[DEMO] " << e.what() << '\n';
        return 2;
    }

    if (!allPassed) {
        std::cerr << "[DEMO] at least one scenario did not match its expected score\n";
        return 1;
    }
    return 0;
}
