#include "core/BowlingGame.hpp"

#include <cmath>
#include <sstream>
#include <string>

namespace bowling::core {

void BowlingGame::roll(int pins) {
    if (pins < kMinPins || pins > kMaxPins) {
        throw InvalidRollError(std::to_string(pins),
                               "pins must be between 0 and 10 inclusive");
    }
    rolls_.push_back(pins);
}

void BowlingGame::roll(double pins) {
    if (!std::isfinite(pins) || std::trunc(pins) != pins) {
        std::ostringstream os;
        os << pins;
        throw InvalidRollError(os.str(), "pins must be an integer");
    }
    if (pins < kMinPins || pins > kMaxPins) {
        std::ostringstream os;
        os << pins;
        throw InvalidRollError(os.str(), "pins must be between 0 and 10 inclusive");
    }
    roll(static_cast<int>(pins));
}

int BowlingGame::score() const noexcept {
    int total = 0;
    std::size_t cursor = 0;

    for (int frame = 0; frame < kFramesPerGame; ++frame) {
        if (isStrike(cursor)) {
            total += kMaxPins + pinsAt(cursor + 1) + pinsAt(cursor + 2);
            cursor += 1;
        } else if (isSpare(cursor)) {
            total += kMaxPins + pinsAt(cursor + 2);
            cursor += 2;
        } else {
            total += pinsAt(cursor) + pinsAt(cursor + 1);
            cursor += 2;
        }
    }
    // Anything left past cursor is frame 10 bonus, already counted above
    return total;
}

bool BowlingGame::isStrike(std::size_t i) const noexcept {
    return i < rolls_.size() && rolls_[i] == kMaxPins;
}

bool BowlingGame::isSpare(std::size_t i) const noexcept {
    return i + 1 < rolls_.size() && rolls_[i] + rolls_[i + 1] == kMaxPins;
}

} // namespace bowling::core
