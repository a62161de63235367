// synth_engine.hpp
// binaural drone / tremolo / FM / grain+noise / pan renderer
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <vector>

#include "chaossynth/config.hpp"
#include "chaossynth/parameter_exchange.hpp"
#include "chaossynth/types.hpp"

namespace chaossynth {

static constexpr double TWO_PI = 6.283185307179586476925286766559;

// Wraps any finite phase into [0, 2π).
double wrapPhase(double phase);

// Mutated only by the render context.
struct EngineState {
    double phaseLeft = 0.0;
    double phaseRight = 0.0;
    double phaseLfo = 0.0;
    double phaseFm = 0.0;
    int sampleRate = FS;
    int blockFrames = BLOCK_FRAMES;
};

struct StereoBlock {
    std::vector<float> left;
    std::vector<float> right;
};

class SynthEngine {
public:
    explicit SynthEngine(const AudioConfig& cfg = AudioConfig{});
    SynthEngine(const SynthEngine&) = delete;
    SynthEngine& operator=(const SynthEngine&) = delete;

    // Frame context. Never blocks; the latest call wins.
    void setParameters(const AudioParameters& params);

    // Any context. Output gain ramps toward the target over fadeSec.
    void setGainTarget(double target);
    double gainTarget() const { return gainTarget_.load(std::memory_order_relaxed); }

    // Audio context. Interleaved stereo, frames * 2 floats. Silence until
    // the first setParameters().
    void render(float* interleaved, std::size_t frames) noexcept;

    // Allocating convenience for simulation and tests.
    StereoBlock render(std::size_t frames);

    // Gain has fully ramped down and the target is zero.
    bool isSilent() const;

    // Mono mix of the most recent block.
    std::vector<float> waveform() const;

    const EngineState& state() const { return state_; }
    const AudioConfig& config() const { return cfg_; }
    std::uint64_t blocksRendered() const { return blocks_.load(std::memory_order_relaxed); }

private:
    void captureWaveform(const float* interleaved, std::size_t frames) noexcept;

    AudioConfig cfg_;
    EngineState state_;
    ParameterExchange<AudioParameters> params_;

    // Starts silent and fades in toward the target.
    std::atomic<float> gainTarget_{1.0f};
    std::atomic<float> gainLevel_{0.0f};
    double gain_ = 0.0;

    std::mt19937 rng_;
    std::uniform_real_distribution<float> noise_{-1.0f, 1.0f};
    std::bernoulli_distribution coin_{0.5};
    std::size_t grainLen_ = 1;
    std::size_t grainPos_ = 0;
    bool grainOpen_ = true;

    mutable std::mutex waveMutex_;
    std::vector<float> wave_;
    std::size_t waveLen_ = 0;
    std::atomic<std::uint64_t> blocks_{0};
};

}  // namespace chaossynth
