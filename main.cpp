// main.cpp
// camera-driven chaos synth
// Stillness settles into a binaural drone, movement scatters it.
// Uses OpenCV for vision and PortAudio for audio

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "chaossynth/audio_output.hpp"
#include "chaossynth/config.hpp"
#include "chaossynth/frame_source.hpp"
#include "chaossynth/log.hpp"
#include "chaossynth/orchestrator.hpp"

using namespace chaossynth;
using namespace std::chrono;

// Console commands: r | a | t <sec> | w <local> <global> | s | q
static bool handleCommand(const std::string& line, Orchestrator& orch) {
    std::istringstream in(line);
    std::string cmd;
    if (!(in >> cmd)) return true;
    if (cmd == "q") return false;
    if (cmd == "r") {
        orch.submit(Command::reset());
    } else if (cmd == "a") {
        orch.submit(orch.audioMode() == AudioMode::Enabled ? Command::disableAudio() : Command::enableAudio());
    } else if (cmd == "t") {
        double tau = 0;
        if (in >> tau) orch.submit(Command::decayTime(tau));
        else logWarn("INFO", "usage: t <seconds>");
    } else if (cmd == "w") {
        double l = 0, g = 0;
        if (in >> l >> g) orch.submit(Command::motionWeights(l, g));
        else logWarn("INFO", "usage: w <local> <global>");
    } else if (cmd == "s") {
        PipelineSnapshot s = orch.snapshot();
        std::ostringstream os;
        os << "chaos " << s.score << " (" << toString(s.level) << "), "
           << toString(s.metrics.motionType) << " energy " << s.metrics.motionEnergy
           << " velocity " << s.metrics.globalVelocity << ", base " << s.params.baseFreq
           << " Hz, fps " << s.fps << ", audio " << toString(s.audioMode);
        logInfo("Status", os.str());
    } else {
        logWarn("INFO", "unknown command '" + cmd + "'");
    }
    return true;
}

int main(int argc, char** argv) {
    PipelineConfig cfg;
    if (argc > 1) cfg.cameraIndex = std::atoi(argv[1]);

    Orchestrator orch(cfg);
    CameraFrameSource camera(cfg.cameraIndex);
    if (!camera.open()) return 1;

    // Start audio; without a device the engine keeps running silently
    std::unique_ptr<AudioSink> sink = openAudioOutput(orch.engine());
    logInfo("Audio", std::string("output mode ") + toString(sink->mode()));
    if (sink->mode() == OutputMode::Live) orch.submit(Command::enableAudio());

    std::atomic<bool> running{true};
    std::thread frameThread([&] { orch.run(camera, running); });

    logInfo("INFO", "running. r=reset a=audio t <sec>=decay w <l> <g>=weights s=status q=quit");
    std::string line;
    while (running && std::getline(std::cin, line)) {
        if (!handleCommand(line, orch)) break;
    }
    running = false;
    frameThread.join();

    // Fade out before closing the stream
    if (!orch.stopAudio(milliseconds(int(cfg.audio.fadeSec * 1000) + 250)))
        logWarn("Audio", "fade-out did not complete");
    sink->stop();
    camera.release();
    orch.logSummary();
    return 0;
}
