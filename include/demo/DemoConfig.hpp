#pragma once

#include <string>
#include <vector>

namespace bowling::demo {

struct DemoConfig {
    std::vector<std::string> scenarioNames; // empty = run every built-in scenario

    bool hasCustomRolls{false};
    std::vector<int> customRolls;          // from --rolls 10,3,6,...

    bool listOnly{false};
    bool verbose{false};                   // log every roll
};

// Parses the arguments after argv[0]. Throws std::invalid_argument on
// unknown options, missing values or non-numeric roll tokens.
DemoConfig parseDemoArgs(const std::vector<std::string>& args);

} // namespace bowling::demo
