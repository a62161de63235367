// types.hpp
// values exchanged between the pipeline stages
#pragma once

#include <cstdint>

namespace chaossynth {

enum class MotionType { Still, Local, Global };

enum class FrameStatus {
    Ok,
    FrameUnavailable,        // no frame this cycle
    InvalidFrameDimensions,  // size or channel count differs from the agreed input
    NumericDegenerate        // flow produced non-finite values
};

struct Point2 {
    double x = 0.5;
    double y = 0.5;
};

// One reading per cycle. All scalars normalised to [0,1].
struct MotionMetrics {
    double motionEnergy = 0.0;
    double globalVelocity = 0.0;
    Point2 center;
    MotionType motionType = MotionType::Still;
};

struct MotionReading {
    FrameStatus status = FrameStatus::Ok;
    MotionMetrics metrics;
};

// Snapshot handed to the synth engine; never mutated once published.
struct AudioParameters {
    double baseFreq = 100.0;     // [100,800] Hz
    double binauralDiff = 5.0;   // [0.5,5] Hz
    double lfoRate = 0.0;        // [0,12] Hz
    double lfoDepth = 0.0;       // [0,1]
    double fmAmount = 0.0;       // [0,1000] Hz deviation
    double noiseAmount = 0.0;    // [0,0.75]
    double grainRate = 0.0;      // [0,100] grains/s
    double pan = 0.0;            // [-1,1]
    double amplitude = 0.3;      // [0.3,0.7]
    double chaosLevel = 0.0;
};

enum class ChaosLevel { Still, Gentle, Active, HighChaos };

enum class AudioMode { Disabled, Enabled, Stopped };
enum class AudioCommand { EnableAudio, DisableAudio, Stop };
enum class OutputMode { Live, Simulated };

const char* toString(MotionType t);
const char* toString(FrameStatus s);
const char* toString(ChaosLevel l);
const char* toString(AudioMode m);
const char* toString(OutputMode m);

}  // namespace chaossynth
