#pragma once

// Namespace for bowling core types
namespace bowling::core {

// A game always has ten frames; bonus rolls only extend frame 10
constexpr int kFramesPerGame = 10;

// Valid pin counts for a single roll
constexpr int kMinPins = 0;
constexpr int kMaxPins = 10;

} // namespace bowling::core
