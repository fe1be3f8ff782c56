#pragma once

#include <stdexcept>
#include <string>

namespace bowling::core {

// Thrown by BowlingGame::roll when a pin count is out of range or not integral.
class InvalidRollError : public std::invalid_argument {
public:
    InvalidRollError(const std::string& value, const std::string& reason)
        : std::invalid_argument("invalid roll " + value + ": " + reason)
        , value_{value}
    {
    }

    // The rejected value, as text (it may have been an int or a double)
    const std::string& value() const noexcept { return value_; }

private:
    std::string value_;
};

} // namespace bowling::core
