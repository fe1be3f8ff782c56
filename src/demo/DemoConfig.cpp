#include "demo/DemoConfig.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace bowling::demo {

namespace {
    // Digits only: no sign, no surrounding whitespace, no empty token
    int parseRollToken(const std::string& token) {
        if (token.empty() || !std::isdigit(static_cast<unsigned char>(token.front()))) {
            throw std::invalid_argument("not a roll value: '" + token + "'");
        }
        std::size_t consumed = 0;
        int value = 0;
        try {
            value = std::stoi(token, &consumed);
        } catch (const std::exception&) {
            throw std::invalid_argument("not a roll value: '" + token + "'");
        }
        if (consumed != token.size()) {
            throw std::invalid_argument("not a roll value: '" + token + "'");
        }
        return value;
    }

    std::vector<int> parseRollList(const std::string& text) {
        if (!text.empty() && text.back() == ',') {
            throw std::invalid_argument("trailing comma in --rolls: '" + text + "'");
        }
        std::vector<int> rolls;
        std::istringstream is(text);
        std::string token;
        while (std::getline(is, token, ',')) {
            rolls.push_back(parseRollToken(token));
        }
        if (rolls.empty()) {
            throw std::invalid_argument("--rolls needs at least one value");
        }
        return rolls;
    }
}

DemoConfig parseDemoArgs(const std::vector<std::string>& args) {
    DemoConfig cfg;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--list") {
            cfg.listOnly = true;
        } else if (arg == "--verbose" || arg == "-v") {
            cfg.verbose = true;
        } else if (arg == "--scenario" || arg == "--rolls") {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(arg + " requires a value");
            }
            const std::string& value = args[++i];
            if (arg == "--scenario") {
                cfg.scenarioNames.push_back(value);
            } else {
                cfg.customRolls = parseRollList(value);
                cfg.hasCustomRolls = true;
            }
        } else {
            throw std::invalid_argument("unknown option: " + arg);
        }
    }

    return cfg;
}

} // namespace bowling::demo
