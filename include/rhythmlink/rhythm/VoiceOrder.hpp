#pragma once

#include "rhythmlink/score/Score.hpp"

#include <array>
#include <cstdint>
#include <stdexcept>

namespace rhythmlink::rhythm {

/// Raised when a caller breaks a documented contract, e.g. comparing voices of two stacks.
class PreconditionViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

struct VoiceColor {
    uint8_t red = 0;
    uint8_t green = 0;
    uint8_t blue = 0;
    uint8_t alpha = 0;

    bool operator==(const VoiceColor&) const = default;
};

inline constexpr uint8_t kVoiceColorAlpha = 200;

inline constexpr std::array<VoiceColor, 8> kVoiceColors = {{
    {128, 64, 255, kVoiceColorAlpha},  // purple
    {0, 255, 0, kVoiceColorAlpha},     // green
    {165, 42, 42, kVoiceColorAlpha},   // brown
    {255, 0, 255, kVoiceColorAlpha},   // magenta
    {0, 255, 255, kVoiceColorAlpha},   // cyan
    {255, 200, 0, kVoiceColorAlpha},   // orange
    {255, 150, 150, kVoiceColorAlpha}, // pink
    {0, 128, 128, kVoiceColorAlpha},   // blue green
}};

/// Compare by voice ID. Negative, zero or positive like strcmp.
int orderById(const score::Voice& v1, const score::Voice& v2);

/// Compare by vertical position within a stack: part, family, first slot, then chord ordinate.
/// Throws PreconditionViolation when the voices do not belong to the same stack.
int orderByPosition(const score::Score& score, const score::Voice& v1, const score::Voice& v2);

/// Strict weak ordering on voice indices, for std::sort.
struct VoicePositionLess {
    const score::Score& score;

    bool operator()(int lhs, int rhs) const;
};

/// Palette entry of a voice ID, used circularly.
VoiceColor colorOf(int id);
VoiceColor colorOf(const score::Voice& voice);
constexpr int colorCount() { return static_cast<int>(kVoiceColors.size()); }

}  // namespace rhythmlink::rhythm
