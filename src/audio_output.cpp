#include "chaossynth/audio_output.hpp"

#include <chrono>
#include <string>
#include <vector>

#include "chaossynth/log.hpp"

using namespace std::chrono;

namespace chaossynth {

PortAudioOutput::PortAudioOutput(SynthEngine& engine) : engine_(engine) {}

PortAudioOutput::~PortAudioOutput() { stop(); }

// PortAudio callback: stereo float32, straight from the engine
int PortAudioOutput::paCallback(const void*, void* out, unsigned long frames,
                                const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags, void* user) {
    auto* self = static_cast<PortAudioOutput*>(user);
    self->engine_.render(static_cast<float*>(out), frames);
    return paContinue;
}

bool PortAudioOutput::start() {
    if (stream_) return true;
    const AudioConfig& cfg = engine_.config();

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        logError("Audio", std::string("Pa_Initialize error: ") + Pa_GetErrorText(err));
        return false;
    }
    initialized_ = true;

    // Check that the desired format is supported
    PaStreamParameters outParams;
    outParams.device = Pa_GetDefaultOutputDevice();
    if (outParams.device == paNoDevice) {
        logError("Audio", "no default output device");
        stop();
        return false;
    }
    const PaDeviceInfo* info = Pa_GetDeviceInfo(outParams.device);
    outParams.channelCount = 2;
    outParams.sampleFormat = paFloat32;
    outParams.suggestedLatency = info ? info->defaultLowOutputLatency : 0.0;
    outParams.hostApiSpecificStreamInfo = nullptr;
    err = Pa_IsFormatSupported(nullptr, &outParams, cfg.sampleRate);
    if (err != paFormatIsSupported) {
        logError("Audio", "stereo float32 at " + std::to_string(cfg.sampleRate) +
                 " Hz not supported: " + Pa_GetErrorText(err));
        stop();
        return false;
    }

    err = Pa_OpenStream(&stream_, nullptr, &outParams, cfg.sampleRate,
                        static_cast<unsigned long>(cfg.blockFrames), paClipOff, paCallback, this);
    if (err != paNoError) {
        logError("Audio", std::string("Pa_OpenStream error: ") + Pa_GetErrorText(err));
        stream_ = nullptr;
        stop();
        return false;
    }
    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        logError("Audio", std::string("Pa_StartStream error: ") + Pa_GetErrorText(err));
        stop();
        return false;
    }
    logInfo("Audio", std::string("PortAudio stream started on ") + (info ? info->name : "default device") +
            ", " + std::to_string(cfg.sampleRate) + " Hz, " + std::to_string(cfg.blockFrames) + " frames");
    return true;
}

void PortAudioOutput::stop() {
    if (stream_) {
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) logWarn("Audio", std::string("Pa_StopStream error: ") + Pa_GetErrorText(err));
        err = Pa_CloseStream(stream_);
        if (err != paNoError) logWarn("Audio", std::string("Pa_CloseStream error: ") + Pa_GetErrorText(err));
        stream_ = nullptr;
    }
    if (initialized_) {
        Pa_Terminate();
        initialized_ = false;
    }
}

SimulatedOutput::SimulatedOutput(SynthEngine& engine) : engine_(engine) {}

SimulatedOutput::~SimulatedOutput() { stop(); }

bool SimulatedOutput::start() {
    if (running_) return true;
    running_ = true;
    thread_ = std::thread(&SimulatedOutput::renderLoop, this);
    return true;
}

void SimulatedOutput::stop() {
    running_ = false;
    if (thread_.joinable()) thread_.join();
}

void SimulatedOutput::renderLoop() {
    const AudioConfig& cfg = engine_.config();
    const auto period = duration_cast<steady_clock::duration>(
        duration<double>(double(cfg.blockFrames) / cfg.sampleRate));
    std::vector<float> block(static_cast<std::size_t>(cfg.blockFrames) * 2);
    auto next = steady_clock::now();
    while (running_) {
        engine_.render(block.data(), static_cast<std::size_t>(cfg.blockFrames));
        next += period;
        std::this_thread::sleep_until(next);
    }
}

std::unique_ptr<AudioSink> openAudioOutput(SynthEngine& engine) {
    auto live = std::make_unique<PortAudioOutput>(engine);
    if (live->start()) return live;

    logWarn("Audio", "audio device unavailable, rendering in simulated mode (no sound)");
    auto sim = std::make_unique<SimulatedOutput>(engine);
    sim->start();
    return sim;
}

}  // namespace chaossynth
