// config.hpp
// tunable constants and per-component configuration
// Tunable parameters marked with // <<< TUNABLE >>>
#pragma once

#include <cstddef>
#include <cstdint>

namespace chaossynth {

// <<< TUNABLE >>> Motion analysis
static constexpr int    PROC_WIDTH          = 320;   // frames are resized to this before flow
static constexpr int    PROC_HEIGHT         = 240;
static constexpr double FLOW_PYR_SCALE      = 0.5;
static constexpr int    FLOW_LEVELS         = 3;
static constexpr int    FLOW_WINSIZE        = 15;
static constexpr int    FLOW_ITERATIONS     = 3;
static constexpr int    FLOW_POLY_N         = 5;
static constexpr double FLOW_POLY_SIGMA     = 1.2;
static constexpr int    BLUR_KERNEL         = 5;
static constexpr double ENERGY_SCALE_PX     = 5.0;   // mean flow magnitude that maps to energy 1.0
static constexpr double STILL_ENERGY_MAX    = 0.15;  // energy <= this is Still
static constexpr double LOCAL_VELOCITY_MAX  = 0.3;   // velocity <= this is Local
static constexpr std::size_t MOTION_HISTORY = 30;    // 1 s at 30 fps

// <<< TUNABLE >>> Chaos dynamics
static constexpr double DECAY_TAU_SEC       = 2.5;   // healing time constant
static constexpr double ALPHA_RISE          = 0.4;
static constexpr double ALPHA_FALL          = 0.1;
static constexpr double LOCAL_WEIGHT        = 0.6;
static constexpr double GLOBAL_WEIGHT       = 0.4;
static constexpr double NONTRIVIAL_SIGNAL   = 0.05;  // both signals above this -> blend
static constexpr std::size_t CHAOS_HISTORY  = 10;

// <<< TUNABLE >>> Audio
static constexpr int    FS                  = 44100;
static constexpr int    BLOCK_FRAMES        = 2048;  // ~46 ms at 44.1 kHz
static constexpr double GRAIN_SEC           = 0.020;
static constexpr double FADE_SEC            = 0.150;

// <<< TUNABLE >>> Pipeline
static constexpr double TARGET_FPS          = 30.0;
static constexpr int    CAMERA_INDEX        = 0;

struct AnalyzerConfig {
    int procWidth = PROC_WIDTH;
    int procHeight = PROC_HEIGHT;
    // Agreed input size; 0x0 locks to the first accepted frame.
    int inputWidth = 0;
    int inputHeight = 0;
    double pyrScale = FLOW_PYR_SCALE;
    int levels = FLOW_LEVELS;
    int winsize = FLOW_WINSIZE;
    int iterations = FLOW_ITERATIONS;
    int polyN = FLOW_POLY_N;
    double polySigma = FLOW_POLY_SIGMA;
    int blurKernel = BLUR_KERNEL;
    double energyScale = ENERGY_SCALE_PX;
    std::size_t historySize = MOTION_HISTORY;
};

struct ChaosConfig {
    double decayTau = DECAY_TAU_SEC;
    double alphaRise = ALPHA_RISE;
    double alphaFall = ALPHA_FALL;
    double localWeight = LOCAL_WEIGHT;
    double globalWeight = GLOBAL_WEIGHT;
    double nontrivialSignal = NONTRIVIAL_SIGNAL;
    std::size_t historySize = CHAOS_HISTORY;
};

struct AudioConfig {
    int sampleRate = FS;
    int blockFrames = BLOCK_FRAMES;
    double grainSec = GRAIN_SEC;
    double fadeSec = FADE_SEC;
    std::uint32_t seed = 0;  // 0 = seed from std::random_device
};

struct PipelineConfig {
    AnalyzerConfig analyzer;
    ChaosConfig chaos;
    AudioConfig audio;
    double targetFps = TARGET_FPS;
    int cameraIndex = CAMERA_INDEX;
};

}  // namespace chaossynth
