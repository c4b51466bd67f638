#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <vector>

#include "AudioBackend.hpp"
#include "SampleRing.hpp"
#include "DspBlocks.hpp"

struct SourceOptions {
    bool dc_block = true;
    std::chrono::milliseconds first_retry{250};
    std::chrono::milliseconds max_retry{4000};
    int max_attempts = 5;
};

// Owns the live capture stream and feeds SampleRing with mono samples.
// Control calls (open, switch_to, poll, close) may come from any non-audio
// thread and are serialized internally. The capture callback takes no lock.
class SampleSource {
public:
    SampleSource(AudioBackend& backend, SampleRing& ring, SourceOptions opts = SourceOptions());
    ~SampleSource();

    SampleSource(const SampleSource&) = delete;
    SampleSource& operator=(const SampleSource&) = delete;

    std::vector<Device> enumerate();

    // Opens device_id (-1 = default). Falls back to the default device and
    // reports DeviceUnavailable if the requested one cannot be opened;
    // is_open() tells whether any stream is running.
    DeviceError open(int device_id);

    // Tears down the current stream, discards its queued samples and opens
    // device_id. Falls back to the default, then to the last good device.
    DeviceError switch_to(int device_id);

    // Supervisor step. Detects a dead stream and reopens with backoff.
    void poll(std::chrono::steady_clock::time_point now);

    void close();

    bool is_open() const { return open_.load(std::memory_order_acquire); }
    bool failed() const { return failed_.load(std::memory_order_acquire); }
    int sample_rate() const { return sample_rate_.load(std::memory_order_acquire); }
    uint64_t frames_captured() const { return frames_.load(std::memory_order_relaxed); }
    uint64_t dropped() const { return ring_.dropped(); }
    uint64_t input_overflows() const;

    DeviceError last_error() const;
    Device current() const;

    // Capture callback, audio thread
    static void on_capture(const float* input, unsigned long frames, int channels, void* user);

private:
    DeviceError open_locked(int device_id);
    bool open_device(const Device& dev);
    void close_locked();

    AudioBackend& backend_;
    SampleRing& ring_;
    SourceOptions opts_;

    mutable std::mutex mtx;                 // control plane only
    Device current_;
    Device last_good_;
    DeviceError last_error_ = DeviceError::None;

    bool interrupted_ = false;
    int attempts_ = 0;
    std::chrono::milliseconds backoff_{0};
    std::chrono::steady_clock::time_point next_retry_;

    std::atomic<bool> open_{false};
    std::atomic<bool> failed_{false};
    std::atomic<int> sample_rate_{0};
    std::atomic<uint64_t> frames_{0};

    DcBlocker dc_;                          // audio thread, reset while stopped
};
