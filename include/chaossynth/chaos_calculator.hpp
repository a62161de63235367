// chaos_calculator.hpp
// folds motion readings into one smoothed chaos score
#pragma once

#include <chrono>
#include <deque>

#include "chaossynth/config.hpp"
#include "chaossynth/types.hpp"

namespace chaossynth {

using Clock = std::chrono::steady_clock;

// Owned by the frame context only.
struct ChaosState {
    double score = 0.0;
    double target = 0.0;
    MotionType lastMotionType = MotionType::Still;
    Point2 lastCenter;
    Clock::time_point lastUpdate{};
    bool hasTimestamp = false;
};

// Parameter mapping. Pure functions of the chaos score c in [0,1].
double mapBaseFreq(double c);
double mapBinauralDiff(double c);
double mapLfoRate(double c);
double mapLfoDepth(double c);
double mapFmAmount(double c);
double mapNoiseAmount(double c);
double mapGrainRate(double c);
double mapAmplitude(double c);
double mapPan(double centerX);
AudioParameters mapParameters(double c, double centerX);

// Pixel x position -> pan in [-1,1].
double mapPositionToPan(double xPixels, double width);

// score * e^(-dt/tau)
double healingDecay(double score, double dt, double tau);

ChaosLevel chaosLevel(double score);

class ChaosCalculator {
public:
    explicit ChaosCalculator(const ChaosConfig& cfg = ChaosConfig{}, double initialScore = 0.0);

    // Smoothing toward the target, then the Still decay. dt in seconds;
    // dt <= 0 leaves the score where it is.
    double update(const MotionMetrics& metrics, double dt);

    // Same, with dt measured from the previous timestamped update.
    // The first timestamped update only records the time.
    double updateAt(const MotionMetrics& metrics, Clock::time_point now);

    double reset();

    AudioParameters currentParameters() const;
    double targetFor(const MotionMetrics& metrics) const;

    bool setDecayTime(double tau);
    bool setMotionWeights(double localWeight, double globalWeight);

    double score() const { return state_.score; }
    const ChaosState& state() const { return state_; }
    const ChaosConfig& config() const { return cfg_; }
    ChaosLevel level() const { return chaosLevel(state_.score); }
    const std::deque<double>& history() const { return history_; }

private:
    ChaosConfig cfg_;
    ChaosState state_;
    std::deque<double> history_;
};

}  // namespace chaossynth
