// audio_output.hpp
// drives SynthEngine::render from a real-time context
#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include <portaudio.h>

#include "chaossynth/synth_engine.hpp"
#include "chaossynth/types.hpp"

namespace chaossynth {

class AudioSink {
public:
    virtual ~AudioSink() = default;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool running() const = 0;
    virtual OutputMode mode() const = 0;
};

// PortAudio default output device, stereo float32, one render per callback.
class PortAudioOutput : public AudioSink {
public:
    explicit PortAudioOutput(SynthEngine& engine);
    ~PortAudioOutput() override;

    bool start() override;
    void stop() override;
    bool running() const override { return stream_ != nullptr; }
    OutputMode mode() const override { return OutputMode::Live; }

private:
    static int paCallback(const void*, void* out, unsigned long frames,
                          const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags, void* user);

    SynthEngine& engine_;
    PaStream* stream_ = nullptr;
    bool initialized_ = false;
};

// No device: keeps rendering at block cadence on its own thread and drops
// the samples, so the engine state and waveform stay live.
class SimulatedOutput : public AudioSink {
public:
    explicit SimulatedOutput(SynthEngine& engine);
    ~SimulatedOutput() override;

    bool start() override;
    void stop() override;
    bool running() const override { return running_; }
    OutputMode mode() const override { return OutputMode::Simulated; }

private:
    void renderLoop();

    SynthEngine& engine_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

// Live output when a device opens, otherwise a started SimulatedOutput.
// The device failure is reported once, here.
std::unique_ptr<AudioSink> openAudioOutput(SynthEngine& engine);

}  // namespace chaossynth
