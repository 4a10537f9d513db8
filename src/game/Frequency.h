#pragma once

#include <optional>
#include <string>

#include <glm/vec4.hpp>

#include "net/Rows.h"

// Frequency — the six standard packet frequencies (radians) and the colour
// palettes the visuals derive from them.
namespace game::frequency {

constexpr float kRed = 0.0f;
constexpr float kYellow = 1.047f;
constexpr float kGreen = 2.094f;
constexpr float kCyan = 3.142f;
constexpr float kBlue = 4.189f;
constexpr float kMagenta = 5.236f;
constexpr float kTwoPi = 6.283185f;

constexpr float kStandard[6] = {kRed, kYellow, kGreen, kCyan, kBlue, kMagenta};

inline float normalize(float radians) { return radians / kTwoPi; }
inline float denormalize(float normalized) { return normalized * kTwoPi; }

// Packet colour; thresholds on the normalized frequency 0.1/0.25/0.4/0.55/0.75.
glm::vec4 colorFor(float radians);
float nearestStandard(float radians);
// "Red".."Magenta" within 0.1 rad of a standard, else "Custom(x.xxx)".
std::string name(float radians);

// Source palette: translucent (alpha 0.7), thresholds 0.08/0.25/0.42/0.58/0.75.
glm::vec4 sourceColor(float radians);
// Count-weighted average of sourceColor over the composition, opaque; white when empty.
glm::vec4 blendComposition(const net::Composition& composition);

// Storage palette: standard colour within 0.5 rad, else white.
glm::vec4 storageColor(float radians);
// Frequency with the highest count; nullopt when empty or all counts are zero.
std::optional<float> dominantFrequency(const net::Composition& composition);

// First sample (by index) whose count dropped between two compositions.
std::optional<float> findDecreasedFrequency(const net::Composition& before, const net::Composition& after);
bool compositionChanged(const net::Composition& before, const net::Composition& after);
// Merge by exact frequency, summing counts; order of first appearance is kept.
void mergeInto(net::Composition& target, const net::Composition& samples);

} // namespace game::frequency
