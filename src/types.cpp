#include "chaossynth/types.hpp"

namespace chaossynth {

const char* toString(MotionType t) {
    switch (t) {
        case MotionType::Still:  return "still";
        case MotionType::Local:  return "local";
        case MotionType::Global: return "global";
    }
    return "unknown";
}

const char* toString(FrameStatus s) {
    switch (s) {
        case FrameStatus::Ok:                     return "ok";
        case FrameStatus::FrameUnavailable:       return "frame unavailable";
        case FrameStatus::InvalidFrameDimensions: return "invalid frame dimensions";
        case FrameStatus::NumericDegenerate:      return "numeric degenerate";
    }
    return "unknown";
}

const char* toString(ChaosLevel l) {
    switch (l) {
        case ChaosLevel::Still:     return "Still (Ethereal Drone)";
        case ChaosLevel::Gentle:    return "Gentle Motion (Ripple)";
        case ChaosLevel::Active:    return "Active Motion (Rising Tension)";
        case ChaosLevel::HighChaos: return "High Chaos (Scatter/Shatter)";
    }
    return "unknown";
}

const char* toString(AudioMode m) {
    switch (m) {
        case AudioMode::Disabled: return "disabled";
        case AudioMode::Enabled:  return "enabled";
        case AudioMode::Stopped:  return "stopped";
    }
    return "unknown";
}

const char* toString(OutputMode m) {
    switch (m) {
        case OutputMode::Live:      return "live";
        case OutputMode::Simulated: return "simulated";
    }
    return "unknown";
}

}  // namespace chaossynth
