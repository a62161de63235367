#include "chaossynth/chaos_calculator.hpp"

#include <algorithm>
#include <cmath>

namespace chaossynth {

namespace {
double unit(double v) { return std::isfinite(v) ? std::clamp(v, 0.0, 1.0) : 0.0; }
}  // namespace

double mapBaseFreq(double c) { return 100.0 + 700.0 * unit(c); }
double mapBinauralDiff(double c) { return 5.0 - 4.5 * unit(c); }
double mapLfoRate(double c) { return 12.0 * unit(c); }
double mapFmAmount(double c) { return 1000.0 * unit(c) * unit(c); }
double mapGrainRate(double c) { return 100.0 * unit(c); }
double mapAmplitude(double c) { return 0.3 + 0.4 * unit(c); }

// Parabola, peaks at c = 0.5 for the strongest ripple.
double mapLfoDepth(double c) {
    c = unit(c);
    return 4.0 * c * (1.0 - c);
}

// Silent below c = 0.7, full 0.75 at c = 1.
double mapNoiseAmount(double c) {
    return 0.75 * std::clamp((unit(c) - 0.7) / 0.3, 0.0, 1.0);
}

double mapPan(double centerX) { return 2.0 * unit(centerX) - 1.0; }

double mapPositionToPan(double xPixels, double width) {
    if (!(width > 0.0)) return 0.0;
    return std::clamp(xPixels / width * 2.0 - 1.0, -1.0, 1.0);
}

AudioParameters mapParameters(double c, double centerX) {
    AudioParameters p;
    p.baseFreq = mapBaseFreq(c);
    p.binauralDiff = mapBinauralDiff(c);
    p.lfoRate = mapLfoRate(c);
    p.lfoDepth = mapLfoDepth(c);
    p.fmAmount = mapFmAmount(c);
    p.noiseAmount = mapNoiseAmount(c);
    p.grainRate = mapGrainRate(c);
    p.pan = mapPan(centerX);
    p.amplitude = mapAmplitude(c);
    p.chaosLevel = unit(c);
    return p;
}

double healingDecay(double score, double dt, double tau) {
    return score * std::exp(-dt / tau);
}

ChaosLevel chaosLevel(double score) {
    if (score < 0.2) return ChaosLevel::Still;
    if (score < 0.5) return ChaosLevel::Gentle;
    if (score < 0.8) return ChaosLevel::Active;
    return ChaosLevel::HighChaos;
}

ChaosCalculator::ChaosCalculator(const ChaosConfig& cfg, double initialScore) : cfg_(cfg) {
    state_.score = unit(initialScore);
}

double ChaosCalculator::targetFor(const MotionMetrics& metrics) const {
    double energy = unit(metrics.motionEnergy);
    double velocity = unit(metrics.globalVelocity);
    bool blend = energy >= cfg_.nontrivialSignal && velocity >= cfg_.nontrivialSignal;
    double drive = (cfg_.localWeight * energy + cfg_.globalWeight * velocity) /
                   (cfg_.localWeight + cfg_.globalWeight);

    switch (metrics.motionType) {
        case MotionType::Still:  return 0.0;
        case MotionType::Local:  return 0.3 + 0.4 * (blend ? drive : energy);
        case MotionType::Global: return 0.5 + 0.5 * (blend ? drive : velocity);
    }
    return 0.0;
}

double ChaosCalculator::update(const MotionMetrics& metrics, double dt) {
    state_.lastMotionType = metrics.motionType;
    if (std::isfinite(metrics.center.x) && std::isfinite(metrics.center.y))
        state_.lastCenter = metrics.center;
    if (!std::isfinite(dt) || dt <= 0.0) return state_.score;

    double target = targetFor(metrics);
    state_.target = target;
    double alpha = target >= state_.score ? cfg_.alphaRise : cfg_.alphaFall;
    double s = alpha * target + (1.0 - alpha) * state_.score;

    if (metrics.motionType == MotionType::Still) s = healingDecay(s, dt, cfg_.decayTau);

    state_.score = unit(s);
    history_.push_back(state_.score);
    while (history_.size() > cfg_.historySize) history_.pop_front();
    return state_.score;
}

double ChaosCalculator::updateAt(const MotionMetrics& metrics, Clock::time_point now) {
    double dt = 0.0;
    if (state_.hasTimestamp) dt = std::chrono::duration<double>(now - state_.lastUpdate).count();
    state_.lastUpdate = now;
    state_.hasTimestamp = true;
    return update(metrics, dt);
}

double ChaosCalculator::reset() {
    state_.score = 0.0;
    state_.target = 0.0;
    state_.lastMotionType = MotionType::Still;
    history_.clear();
    return state_.score;
}

AudioParameters ChaosCalculator::currentParameters() const {
    return mapParameters(state_.score, state_.lastCenter.x);
}

bool ChaosCalculator::setDecayTime(double tau) {
    if (!std::isfinite(tau) || tau <= 0.0) return false;
    cfg_.decayTau = tau;
    return true;
}

bool ChaosCalculator::setMotionWeights(double localWeight, double globalWeight) {
    if (!std::isfinite(localWeight) || !std::isfinite(globalWeight)) return false;
    if (localWeight < 0.0 || globalWeight < 0.0 || localWeight + globalWeight <= 0.0) return false;
    cfg_.localWeight = localWeight;
    cfg_.globalWeight = globalWeight;
    return true;
}

}  // namespace chaossynth
