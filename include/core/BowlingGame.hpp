#pragma once

#include "Types.hpp"
#include "InvalidRollError.hpp"

#include <cstddef>
#include <vector>

namespace bowling::core {

class BowlingGame {
public:
    BowlingGame() = default;

    // Record one roll. Throws InvalidRollError if pins is outside [0, 10];
    // the roll sequence is left untouched in that case.
    void roll(int pins);

    // Same as roll(int) but also rejects non-integral values such as 3.5
    void roll(double pins);

    // Total score so far. Rolls not thrown yet count as 0, so this can be
    // called at any point of the game.
    int score() const noexcept;

    const std::vector<int>& rolls() const noexcept { return rolls_; }
    std::size_t rollCount() const noexcept { return rolls_.size(); }

private:
    std::vector<int> rolls_;

    // Pins of roll i, or 0 if that roll has not happened yet
    int pinsAt(std::size_t i) const noexcept {
        return i < rolls_.size() ? rolls_[i] : 0;
    }

    bool isStrike(std::size_t i) const noexcept;
    bool isSpare(std::size_t i) const noexcept;
};

} // namespace bowling::core
