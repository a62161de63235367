#include "chaossynth/orchestrator.hpp"

#include <cstdio>
#include <string>
#include <thread>

#include "chaossynth/log.hpp"

using namespace std::chrono;

namespace chaossynth {

namespace {
std::string fmt3(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", v);
    return buf;
}
}  // namespace

AudioMode transition(AudioMode mode, AudioCommand cmd) {
    struct Row { AudioMode from; AudioCommand cmd; AudioMode to; };
    static constexpr Row TABLE[] = {
        {AudioMode::Disabled, AudioCommand::EnableAudio,  AudioMode::Enabled},
        {AudioMode::Disabled, AudioCommand::DisableAudio, AudioMode::Disabled},
        {AudioMode::Disabled, AudioCommand::Stop,         AudioMode::Stopped},
        {AudioMode::Enabled,  AudioCommand::EnableAudio,  AudioMode::Enabled},
        {AudioMode::Enabled,  AudioCommand::DisableAudio, AudioMode::Disabled},
        {AudioMode::Enabled,  AudioCommand::Stop,         AudioMode::Stopped},
    };
    for (const auto& row : TABLE)
        if (row.from == mode && row.cmd == cmd) return row.to;
    return mode;  // Stopped
}

Orchestrator::Orchestrator(const PipelineConfig& cfg, double initialScore)
    : cfg_(cfg), analyzer_(cfg.analyzer), chaos_(cfg.chaos, initialScore), engine_(cfg.audio) {
    engine_.setGainTarget(0.0);
    snap_.score = chaos_.score();
    snap_.level = chaos_.level();
    snap_.params = chaos_.currentParameters();
}

void Orchestrator::submit(const Command& cmd) {
    std::lock_guard<std::mutex> lk(cmdMutex_);
    pending_.push_back(cmd);
}

void Orchestrator::applyPending() {
    std::deque<Command> cmds;
    {
        std::lock_guard<std::mutex> lk(cmdMutex_);
        cmds.swap(pending_);
    }
    for (const auto& c : cmds) apply(c);
}

bool Orchestrator::apply(const Command& cmd) {
    switch (cmd.kind) {
        case Command::Kind::Reset:
            chaos_.reset();
            // the c = 0 parameter set goes out in the same cycle
            publish(lastMetrics_, lastStatus_);
            logInfo("Chaos", "reset to 0");
            return true;
        case Command::Kind::EnableAudio:
            setAudioMode(transition(audioMode(), AudioCommand::EnableAudio));
            return audioMode() == AudioMode::Enabled;
        case Command::Kind::DisableAudio:
            setAudioMode(transition(audioMode(), AudioCommand::DisableAudio));
            return audioMode() == AudioMode::Disabled;
        case Command::Kind::Stop:
            setAudioMode(transition(audioMode(), AudioCommand::Stop));
            return true;
        case Command::Kind::SetDecayTime:
            if (!chaos_.setDecayTime(cmd.a)) {
                logWarn("Chaos", "rejected decay time " + fmt3(cmd.a));
                return false;
            }
            logInfo("Chaos", "decay time " + fmt3(cmd.a) + " s");
            return true;
        case Command::Kind::SetMotionWeights:
            if (!chaos_.setMotionWeights(cmd.a, cmd.b)) {
                logWarn("Chaos", "rejected motion weights " + fmt3(cmd.a) + "/" + fmt3(cmd.b));
                return false;
            }
            logInfo("Chaos", "motion weights local " + fmt3(cmd.a) + " global " + fmt3(cmd.b));
            return true;
    }
    return false;
}

void Orchestrator::setAudioMode(AudioMode mode) {
    AudioMode prev = audioMode_.exchange(mode);
    engine_.setGainTarget(mode == AudioMode::Enabled ? 1.0 : 0.0);
    if (prev != mode) logInfo("Audio", std::string("mode ") + toString(prev) + " -> " + toString(mode));
}

bool Orchestrator::stopAudio(milliseconds timeout) {
    apply(Command::stop());
    auto deadline = steady_clock::now() + timeout;
    while (!engine_.isSilent()) {
        if (steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(milliseconds(5));
    }
    return true;
}

void Orchestrator::trackFrameStatus(FrameStatus status) {
    if (status == FrameStatus::FrameUnavailable) {
        ++skipped_;
        if (unavailableStreak_++ == 0) logWarn("Frame", "frame unavailable, skipping cycles");
        return;
    }
    if (unavailableStreak_ > 0) {
        logInfo("Frame", "frames back after " + std::to_string(unavailableStreak_) + " skipped cycles");
        unavailableStreak_ = 0;
    }
    if (status == FrameStatus::InvalidFrameDimensions) {
        ++skipped_;
        if (lastStatus_ != status) logWarn("Frame", "invalid frame dimensions, frame rejected");
    } else if (status == FrameStatus::NumericDegenerate) {
        if (lastStatus_ != status) logWarn("Frame", "non-finite flow, holding previous metrics");
    }
}

CycleResult Orchestrator::processFrame(const cv::Mat& frame, Clock::time_point now) {
    applyPending();

    MotionReading reading = analyzer_.analyze(frame);
    trackFrameStatus(reading.status);
    lastStatus_ = reading.status;

    CycleResult result;
    result.status = reading.status;
    if (reading.status == FrameStatus::FrameUnavailable ||
        reading.status == FrameStatus::InvalidFrameDimensions) {
        // Chaos is not advanced and its timestamp stays put, so the next good
        // cycle decays over the real elapsed time.
        result.score = chaos_.score();
        std::lock_guard<std::mutex> lk(snapMutex_);
        snap_.lastStatus = reading.status;
        snap_.skipped = skipped_;
        return result;
    }

    lastMetrics_ = reading.metrics;
    result.score = chaos_.updateAt(reading.metrics, now);
    result.chaosUpdated = true;

    ++frames_;
    if (frames_ == 1) started_ = windowStart_ = now;
    ++windowFrames_;
    double window = duration<double>(now - windowStart_).count();
    if (window >= 1.0) {
        fps_ = windowFrames_ / window;
        windowStart_ = now;
        windowFrames_ = 0;
    }

    publish(reading.metrics, reading.status);
    return result;
}

void Orchestrator::publish(const MotionMetrics& metrics, FrameStatus status) {
    AudioParameters params = chaos_.currentParameters();
    engine_.setParameters(params);

    std::lock_guard<std::mutex> lk(snapMutex_);
    snap_.score = chaos_.score();
    snap_.target = chaos_.state().target;
    snap_.level = chaos_.level();
    snap_.metrics = metrics;
    snap_.params = params;
    snap_.audioMode = audioMode();
    snap_.lastStatus = status;
    snap_.frames = frames_;
    snap_.skipped = skipped_;
    snap_.fps = fps_;
}

PipelineSnapshot Orchestrator::snapshot() const {
    std::lock_guard<std::mutex> lk(snapMutex_);
    PipelineSnapshot s = snap_;
    s.audioMode = audioMode();
    return s;
}

void Orchestrator::run(FrameSource& source, const std::atomic<bool>& running) {
    const auto period = duration_cast<steady_clock::duration>(duration<double>(1.0 / cfg_.targetFps));
    cv::Mat frame;
    while (running && audioMode() != AudioMode::Stopped) {
        auto t0 = steady_clock::now();
        if (!source.read(frame)) frame.release();
        processFrame(frame, steady_clock::now());
        std::this_thread::sleep_until(t0 + period);
    }
}

void Orchestrator::logSummary() const {
    PipelineSnapshot s = snapshot();
    double elapsed = frames_ > 1 ? duration<double>(Clock::now() - started_).count() : 0.0;
    double avgFps = elapsed > 0.0 ? frames_ / elapsed : 0.0;
    MotionStatistics stats = analyzer_.statistics();
    logInfo("Summary", "total frames: " + std::to_string(s.frames) +
            ", skipped: " + std::to_string(s.skipped) + ", average FPS: " + fmt3(avgFps));
    logInfo("Summary", "motion energy mean " + fmt3(stats.mean) + ", max " + fmt3(stats.max) +
            ", std " + fmt3(stats.stddev));
    logInfo("Summary", "final chaos " + fmt3(s.score) + " (" + toString(s.level) + ")");
}

}  // namespace chaossynth
