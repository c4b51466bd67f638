#pragma once

#include <portaudio.h>
#include <atomic>
#include "AudioBackend.hpp"

// AudioBackend over PortAudio input streams (ALSA / PulseAudio / JACK on Linux).
// Pa_Initialize in the constructor, Pa_Terminate in the destructor.
class PortAudioBackend : public AudioBackend {
public:
    PortAudioBackend();
    ~PortAudioBackend() override;

    PortAudioBackend(const PortAudioBackend&) = delete;
    PortAudioBackend& operator=(const PortAudioBackend&) = delete;

    std::vector<Device> enumerate() override;
    int default_device() override;

    DeviceError open(const Device& dev, CaptureFn cb, void* user) override;
    DeviceError start() override;
    void stop() override;
    void close() override;
    bool is_active() const override;

    uint64_t input_overflows() const override { return overflows_.load(std::memory_order_relaxed); }

private:
    static int paCallback(const void* input, void* output,
                          unsigned long frameCount,
                          const PaStreamCallbackTimeInfo* timeInfo,
                          PaStreamCallbackFlags statusFlags,
                          void* userData);

    PaStream* stream = nullptr;
    bool started = false;
    CaptureFn cb_ = nullptr;
    void* user_ = nullptr;
    int channels_ = 0;
    std::atomic<uint64_t> overflows_{0};
};
