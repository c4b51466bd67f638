#include "PortAudioBackend.hpp"

#include <iostream>
#include <stdexcept>
#include <algorithm>


PortAudioBackend::PortAudioBackend() {
    PaError r = Pa_Initialize();
    if (r != paNoError) {
        throw std::runtime_error(std::string("PortAudio Init Error: ") + Pa_GetErrorText(r));
    }
}

PortAudioBackend::~PortAudioBackend() {
    close();
    Pa_Terminate();
}

std::vector<Device> PortAudioBackend::enumerate() {
    std::vector<Device> out;

    int apis = Pa_GetHostApiCount();
    if (apis < 0) {
        std::cerr << "Pa_GetHostApiCount failed: " << Pa_GetErrorText(apis) << "\n";
        return out;
    }

    // Default host API first, hosts without capture devices contribute nothing
    std::vector<PaHostApiIndex> order;
    PaHostApiIndex def = Pa_GetDefaultHostApi();
    if (def >= 0) order.push_back(def);
    for (PaHostApiIndex h = 0; h < apis; h++) {
        if (h != def) order.push_back(h);
    }

    for (PaHostApiIndex h : order) {
        const PaHostApiInfo* api = Pa_GetHostApiInfo(h);
        if (!api) continue;

        for (int j = 0; j < api->deviceCount; j++) {
            PaDeviceIndex i = Pa_HostApiDeviceIndexToDeviceIndex(h, j);
            if (i < 0) continue;

            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (!info || info->maxInputChannels <= 0) continue;     // capture devices only

            Device d;
            d.id = i;
            d.name = std::string(info->name ? info->name : "(null)");
            if (api->name) d.name += std::string(" [") + api->name + "]";
            d.sample_rate = info->defaultSampleRate;
            d.channels = std::min(info->maxInputChannels, 2);
            out.push_back(d);
        }
    }
    return out;
}

int PortAudioBackend::default_device() {
    PaDeviceIndex idx = Pa_GetDefaultInputDevice();
    return idx == paNoDevice ? -1 : (int)idx;
}

// Audio capture callback
int PortAudioBackend::paCallback(const void* input, void* output,
                                 unsigned long frameCount,
                                 const PaStreamCallbackTimeInfo* timeInfo,
                                 PaStreamCallbackFlags statusFlags,
                                 void* userData)
{
    auto* self = reinterpret_cast<PortAudioBackend*>(userData);
    if (statusFlags & paInputOverflow) {
        self->overflows_.fetch_add(1, std::memory_order_relaxed);
    }
    self->cb_(reinterpret_cast<const float*>(input), frameCount, self->channels_, self->user_);
    return paContinue;
}

DeviceError PortAudioBackend::open(const Device& dev, CaptureFn cb, void* user) {
    close();

    if (dev.id < 0 || dev.id >= Pa_GetDeviceCount() || dev.channels <= 0) {
        return DeviceError::DeviceUnavailable;
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(dev.id);
    if (!info) return DeviceError::DeviceUnavailable;

    PaStreamParameters in{};
    in.device = dev.id;
    in.channelCount = dev.channels;
    in.sampleFormat = paFloat32;                    // PortAudio converts from int formats
    in.suggestedLatency = info->defaultLowInputLatency;
    in.hostApiSpecificStreamInfo = nullptr;

    cb_ = cb;
    user_ = user;
    channels_ = dev.channels;

    PaError err = Pa_OpenStream(
        &stream,
        &in,
        nullptr,                    // no output
        dev.sample_rate,
        paFramesPerBufferUnspecified,
        paClipOff,
        &PortAudioBackend::paCallback,
        this
    );
    if (err != paNoError) {
        std::cerr << "PortAudio Open Stream Error: " << Pa_GetErrorText(err) << std::endl;
        stream = nullptr;
        return DeviceError::DeviceUnavailable;
    }
    return DeviceError::None;
}

DeviceError PortAudioBackend::start() {
    if (!stream) return DeviceError::DeviceUnavailable;

    PaError err = Pa_StartStream(stream);
    if (err != paNoError) {
        std::cerr << "PortAudio Start Stream Error: " << Pa_GetErrorText(err) << std::endl;
        return DeviceError::DeviceUnavailable;
    }
    started = true;
    return DeviceError::None;
}

void PortAudioBackend::stop() {
    if (!stream || !started) return;

    // Pa_StopStream waits for pending callbacks to finish
    PaError err = Pa_StopStream(stream);
    if (err != paNoError) {
        err = Pa_AbortStream(stream);
        if (err != paNoError) {
            std::cerr << "PortAudio Abort Stream Error: " << Pa_GetErrorText(err) << std::endl;
        }
    }
    started = false;
}

void PortAudioBackend::close() {
    if (!stream) return;
    stop();
    PaError err = Pa_CloseStream(stream);
    if (err != paNoError) {
        std::cerr << "PortAudio Close Stream Error: " << Pa_GetErrorText(err) << std::endl;
    }
    stream = nullptr;
}

bool PortAudioBackend::is_active() const {
    if (!stream || !started) return false;
    return Pa_IsStreamActive(stream) == 1;
}
