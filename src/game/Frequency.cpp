#include "Frequency.h"

#include <cmath>

#include <spdlog/fmt/fmt.h>

namespace game::frequency {

namespace {
const glm::vec4 kWhite(1.0f, 1.0f, 1.0f, 1.0f);
const glm::vec4 kRedColor(1.0f, 0.0f, 0.0f, 1.0f);
const glm::vec4 kYellowColor(1.0f, 0.92f, 0.016f, 1.0f);
const glm::vec4 kGreenColor(0.0f, 1.0f, 0.0f, 1.0f);
const glm::vec4 kCyanColor(0.0f, 1.0f, 1.0f, 1.0f);
const glm::vec4 kBlueColor(0.0f, 0.0f, 1.0f, 1.0f);
const glm::vec4 kMagentaColor(1.0f, 0.0f, 1.0f, 1.0f);
constexpr float kSourceAlpha = 0.7f;
constexpr float kNameTolerance = 0.1f;
constexpr float kStorageTolerance = 0.5f;
} // namespace

glm::vec4 colorFor(float radians) {
    const float n = normalize(radians);
    if (n < 0.1f) return kRedColor;
    if (n < 0.25f) return kYellowColor;
    if (n < 0.4f) return kGreenColor;
    if (n < 0.55f) return kCyanColor;
    if (n < 0.75f) return kBlueColor;
    return kMagentaColor;
}

float nearestStandard(float radians) {
    float nearest = kRed;
    float best = std::fabs(radians - kRed);
    for (float f : kStandard) {
        const float d = std::fabs(radians - f);
        if (d < best) {
            best = d;
            nearest = f;
        }
    }
    return nearest;
}

std::string name(float radians) {
    static const char* kNames[6] = {"Red", "Yellow", "Green", "Cyan", "Blue", "Magenta"};
    for (int i = 0; i < 6; ++i) {
        if (std::fabs(radians - kStandard[i]) < kNameTolerance) return kNames[i];
    }
    return fmt::format("Custom({:.3f})", radians);
}

glm::vec4 sourceColor(float radians) {
    const float n = normalize(radians);
    glm::vec4 c;
    if (n < 0.08f) c = kRedColor;
    else if (n < 0.25f) c = glm::vec4(1.0f, 1.0f, 0.0f, 1.0f);
    else if (n < 0.42f) c = kGreenColor;
    else if (n < 0.58f) c = kCyanColor;
    else if (n < 0.75f) c = kBlueColor;
    else c = kMagentaColor;
    c.a = kSourceAlpha;
    return c;
}

glm::vec4 blendComposition(const net::Composition& composition) {
    glm::vec4 sum(0.0f);
    uint64_t total = 0;
    for (const auto& s : composition) {
        sum += sourceColor(s.frequency) * static_cast<float>(s.count);
        total += s.count;
    }
    if (total == 0) return kWhite;
    glm::vec4 out = sum / static_cast<float>(total);
    out.a = 1.0f;
    return out;
}

glm::vec4 storageColor(float radians) {
    const glm::vec4 palette[6] = {kRedColor, glm::vec4(1.0f, 1.0f, 0.0f, 1.0f), kGreenColor,
                                  kCyanColor, kBlueColor, kMagentaColor};
    for (int i = 0; i < 6; ++i) {
        if (std::fabs(radians - kStandard[i]) < kStorageTolerance) return palette[i];
    }
    return kWhite;
}

std::optional<float> dominantFrequency(const net::Composition& composition) {
    uint32_t maxCount = 0;
    std::optional<float> dominant;
    for (const auto& s : composition) {
        if (s.count > maxCount) {
            maxCount = s.count;
            dominant = s.frequency;
        }
    }
    return dominant;
}

std::optional<float> findDecreasedFrequency(const net::Composition& before, const net::Composition& after) {
    for (std::size_t i = 0; i < before.size() && i < after.size(); ++i) {
        if (before[i].count > after[i].count) return before[i].frequency;
    }
    return std::nullopt;
}

bool compositionChanged(const net::Composition& before, const net::Composition& after) {
    if (before.size() != after.size()) return true;
    for (std::size_t i = 0; i < before.size(); ++i) {
        if (before[i].frequency != after[i].frequency || before[i].count != after[i].count) return true;
    }
    return false;
}

void mergeInto(net::Composition& target, const net::Composition& samples) {
    for (const auto& s : samples) {
        bool merged = false;
        for (auto& existing : target) {
            if (existing.frequency == s.frequency) {
                existing.count += s.count;
                merged = true;
                break;
            }
        }
        if (!merged) target.push_back(s);
    }
}

} // namespace game::frequency
