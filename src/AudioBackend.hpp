#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Device {
    int id = -1;                // backend device index
    std::string name;
    double sample_rate = 0.0;   // default rate of the device
    int channels = 0;           // capture channels, at most 2
};

enum class DeviceError {
    None,
    DeviceUnavailable,          // no such device, or it refused to open
    StreamInterrupted           // stream stopped on its own mid-capture
};

inline const char* device_error_text(DeviceError e) {
    switch (e) {
        case DeviceError::None: return "ok";
        case DeviceError::DeviceUnavailable: return "device unavailable";
        case DeviceError::StreamInterrupted: return "stream interrupted";
    }
    return "unknown";
}

// Interleaved float32 block from the audio thread. input may be null on
// driver underrun. Must not allocate, lock or block.
using CaptureFn = void (*)(const float* input, unsigned long frames, int channels, void* user);

// Capture device layer. One stream at a time.
class AudioBackend {
public:
    virtual ~AudioBackend() = default;

    virtual std::vector<Device> enumerate() = 0;
    virtual int default_device() = 0;      // -1 if none

    virtual DeviceError open(const Device& dev, CaptureFn cb, void* user) = 0;
    virtual DeviceError start() = 0;
    virtual void stop() = 0;                // returns after the last callback
    virtual void close() = 0;

    // False once a started stream has stopped delivering (disconnect, driver error)
    virtual bool is_active() const = 0;

    // Blocks the device itself lost before they reached the callback
    virtual uint64_t input_overflows() const = 0;
};
