// orchestrator.hpp
// per-frame cycle, command routing and status snapshot
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>

#include <opencv2/core.hpp>

#include "chaossynth/chaos_calculator.hpp"
#include "chaossynth/config.hpp"
#include "chaossynth/frame_source.hpp"
#include "chaossynth/motion_analyzer.hpp"
#include "chaossynth/synth_engine.hpp"
#include "chaossynth/types.hpp"

namespace chaossynth {

struct Command {
    enum class Kind { Reset, EnableAudio, DisableAudio, Stop, SetDecayTime, SetMotionWeights };
    Kind kind;
    double a = 0.0;
    double b = 0.0;

    static Command reset() { return {Kind::Reset}; }
    static Command enableAudio() { return {Kind::EnableAudio}; }
    static Command disableAudio() { return {Kind::DisableAudio}; }
    static Command stop() { return {Kind::Stop}; }
    static Command decayTime(double tau) { return {Kind::SetDecayTime, tau}; }
    static Command motionWeights(double local, double global) { return {Kind::SetMotionWeights, local, global}; }
};

// Audio on/off as a transition table; Stopped absorbs everything.
AudioMode transition(AudioMode mode, AudioCommand cmd);

struct CycleResult {
    FrameStatus status = FrameStatus::Ok;
    bool chaosUpdated = false;
    double score = 0.0;
};

// Read-only copy for displays. Nothing flows back into the pipeline.
struct PipelineSnapshot {
    double score = 0.0;
    double target = 0.0;
    ChaosLevel level = ChaosLevel::Still;
    MotionMetrics metrics;
    AudioParameters params;
    AudioMode audioMode = AudioMode::Disabled;
    FrameStatus lastStatus = FrameStatus::Ok;
    std::uint64_t frames = 0;
    std::uint64_t skipped = 0;
    double fps = 0.0;
};

class Orchestrator {
public:
    explicit Orchestrator(const PipelineConfig& cfg = PipelineConfig{}, double initialScore = 0.0);

    // Frame context. An empty frame counts as FrameUnavailable.
    CycleResult processFrame(const cv::Mat& frame, Clock::time_point now);

    // Frame loop at cfg.targetFps until running goes false or audio is stopped.
    void run(FrameSource& source, const std::atomic<bool>& running);

    // Any context. Applied at the start of the next cycle.
    void submit(const Command& cmd);

    // Frame context only (or after run() has returned).
    void applyPending();
    bool apply(const Command& cmd);

    // Stop command, then wait for the engine to fade to silence.
    bool stopAudio(std::chrono::milliseconds timeout);

    PipelineSnapshot snapshot() const;
    void logSummary() const;

    SynthEngine& engine() { return engine_; }
    const MotionAnalyzer& analyzer() const { return analyzer_; }
    const ChaosCalculator& chaos() const { return chaos_; }
    AudioMode audioMode() const { return audioMode_.load(); }

private:
    void publish(const MotionMetrics& metrics, FrameStatus status);
    void setAudioMode(AudioMode mode);
    void trackFrameStatus(FrameStatus status);

    PipelineConfig cfg_;
    MotionAnalyzer analyzer_;
    ChaosCalculator chaos_;
    SynthEngine engine_;
    std::atomic<AudioMode> audioMode_{AudioMode::Disabled};

    std::mutex cmdMutex_;
    std::deque<Command> pending_;

    mutable std::mutex snapMutex_;
    PipelineSnapshot snap_;

    MotionMetrics lastMetrics_;
    std::uint64_t frames_ = 0;
    std::uint64_t skipped_ = 0;
    std::uint64_t unavailableStreak_ = 0;
    FrameStatus lastStatus_ = FrameStatus::Ok;
    Clock::time_point started_{};
    Clock::time_point windowStart_{};
    std::uint64_t windowFrames_ = 0;
    double fps_ = 0.0;
};

}  // namespace chaossynth
