#include "chaossynth/synth_engine.hpp"

#include <algorithm>
#include <cmath>

namespace chaossynth {

namespace {
double sane(double v, double lo, double hi, double fallback) {
    return std::isfinite(v) ? std::clamp(v, lo, hi) : fallback;
}
}  // namespace

double wrapPhase(double phase) {
    phase = std::fmod(phase, TWO_PI);
    if (phase < 0.0) phase += TWO_PI;
    if (phase >= TWO_PI) phase = 0.0;  // -tiny + 2π rounds up to 2π
    return phase;
}

SynthEngine::SynthEngine(const AudioConfig& cfg)
    : cfg_(cfg),
      rng_(cfg.seed != 0 ? cfg.seed : std::random_device{}()),
      wave_(static_cast<std::size_t>(std::max(1, cfg.blockFrames)), 0.0f) {
    state_.sampleRate = cfg_.sampleRate;
    state_.blockFrames = cfg_.blockFrames;
    grainLen_ = static_cast<std::size_t>(std::max(1.0, std::round(cfg_.grainSec * cfg_.sampleRate)));
}

void SynthEngine::setParameters(const AudioParameters& in) {
    AudioParameters p;
    p.baseFreq = sane(in.baseFreq, 100.0, 800.0, 100.0);
    p.binauralDiff = sane(in.binauralDiff, 0.5, 5.0, 5.0);
    p.lfoRate = sane(in.lfoRate, 0.0, 12.0, 0.0);
    p.lfoDepth = sane(in.lfoDepth, 0.0, 1.0, 0.0);
    p.fmAmount = sane(in.fmAmount, 0.0, 1000.0, 0.0);
    p.noiseAmount = sane(in.noiseAmount, 0.0, 0.75, 0.0);
    p.grainRate = sane(in.grainRate, 0.0, 100.0, 0.0);
    p.pan = sane(in.pan, -1.0, 1.0, 0.0);
    p.amplitude = sane(in.amplitude, 0.0, 1.0, 0.3);
    p.chaosLevel = sane(in.chaosLevel, 0.0, 1.0, 0.0);
    params_.publish(p);
}

void SynthEngine::setGainTarget(double target) {
    gainTarget_.store(static_cast<float>(sane(target, 0.0, 1.0, 0.0)), std::memory_order_relaxed);
}

bool SynthEngine::isSilent() const {
    return gainTarget_.load(std::memory_order_relaxed) == 0.0f &&
           gainLevel_.load(std::memory_order_relaxed) == 0.0f;
}

void SynthEngine::render(float* out, std::size_t frames) noexcept {
    AudioParameters p;
    const bool live = params_.read(p);
    const double fs = cfg_.sampleRate;
    const double target = gainTarget_.load(std::memory_order_relaxed);
    const double step = 1.0 / std::max(1.0, cfg_.fadeSec * fs);

    const double incLfo = TWO_PI * p.lfoRate / fs;
    const double incFm = TWO_PI * 2.0 * p.baseFreq / fs;
    const double panNorm = (p.pan + 1.0) * 0.5;
    const double gainL = std::sqrt(1.0 - panNorm);
    const double gainR = std::sqrt(panNorm);

    for (std::size_t i = 0; i < frames; ++i) {
        if (gain_ < target) gain_ = std::min(target, gain_ + step);
        else if (gain_ > target) gain_ = std::max(target, gain_ - step);

        if (!live) {
            out[2 * i] = out[2 * i + 1] = 0.0f;
            continue;
        }

        // FM: instantaneous deviation in Hz on both carriers
        double dev = 0.0;
        if (p.fmAmount > 0.0) {
            dev = p.fmAmount * std::sin(state_.phaseFm);
            state_.phaseFm = wrapPhase(state_.phaseFm + incFm);
        }

        double l = std::sin(state_.phaseLeft);
        double r = std::sin(state_.phaseRight);
        state_.phaseLeft = wrapPhase(state_.phaseLeft + TWO_PI * (p.baseFreq + dev) / fs);
        state_.phaseRight = wrapPhase(state_.phaseRight + TWO_PI * (p.baseFreq + p.binauralDiff + dev) / fs);

        double trem = 1.0 + p.lfoDepth * std::sin(state_.phaseLfo);
        state_.phaseLfo = wrapPhase(state_.phaseLfo + incLfo);
        l *= trem;
        r *= trem;

        // grain gate, one coin per grain
        if (grainPos_ == 0) grainOpen_ = coin_(rng_);
        if (++grainPos_ >= grainLen_) grainPos_ = 0;
        if (p.grainRate > 0.0 && !grainOpen_) l = r = 0.0;

        if (p.noiseAmount > 0.0) {
            double n = p.noiseAmount * noise_(rng_);
            l += n;
            r += n;
        }

        const double g = p.amplitude * gain_;
        l *= g * gainL;
        r *= g * gainR;
        out[2 * i] = static_cast<float>(std::isfinite(l) ? std::clamp(l, -1.0, 1.0) : 0.0);
        out[2 * i + 1] = static_cast<float>(std::isfinite(r) ? std::clamp(r, -1.0, 1.0) : 0.0);
    }

    gainLevel_.store(static_cast<float>(gain_), std::memory_order_relaxed);
    captureWaveform(out, frames);
    blocks_.fetch_add(1, std::memory_order_relaxed);
}

StereoBlock SynthEngine::render(std::size_t frames) {
    std::vector<float> buf(frames * 2);
    render(buf.data(), frames);
    StereoBlock block;
    block.left.resize(frames);
    block.right.resize(frames);
    for (std::size_t i = 0; i < frames; ++i) {
        block.left[i] = buf[2 * i];
        block.right[i] = buf[2 * i + 1];
    }
    return block;
}

void SynthEngine::captureWaveform(const float* interleaved, std::size_t frames) noexcept {
    // Readers only ever hold the lock for a copy; skip the update rather than wait.
    std::unique_lock<std::mutex> lk(waveMutex_, std::try_to_lock);
    if (!lk.owns_lock()) return;
    waveLen_ = std::min(frames, wave_.size());
    for (std::size_t i = 0; i < waveLen_; ++i)
        wave_[i] = 0.5f * (interleaved[2 * i] + interleaved[2 * i + 1]);
}

std::vector<float> SynthEngine::waveform() const {
    std::lock_guard<std::mutex> lk(waveMutex_);
    return std::vector<float>(wave_.begin(), wave_.begin() + static_cast<std::ptrdiff_t>(waveLen_));
}

}  // namespace chaossynth
