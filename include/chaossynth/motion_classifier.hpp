// motion_classifier.hpp
// (energy, velocity) -> MotionType decision table
#pragma once

#include "chaossynth/config.hpp"
#include "chaossynth/types.hpp"

namespace chaossynth {

// Rows are checked in order; the first row whose bounds both hold wins.
// Bounds are inclusive, so a value sitting exactly on a threshold
// resolves to the lower-chaos row (energy == 0.15 is Still).
struct ClassificationRule {
    double maxEnergy;
    double maxVelocity;
    MotionType type;
};

static constexpr ClassificationRule CLASSIFICATION_TABLE[] = {
    {STILL_ENERGY_MAX, 1.0, MotionType::Still},
    {1.0, LOCAL_VELOCITY_MAX, MotionType::Local},
    {1.0, 1.0, MotionType::Global},
};

inline MotionType classifyMotion(double energy, double velocity) {
    for (const auto& rule : CLASSIFICATION_TABLE) {
        if (energy <= rule.maxEnergy && velocity <= rule.maxVelocity) return rule.type;
    }
    return MotionType::Global;
}

}  // namespace chaossynth
