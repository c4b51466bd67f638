#include "SampleSource.hpp"

#include <iostream>
#include <algorithm>


static bool find_device(const std::vector<Device>& devices, int id, Device& out) {
    for (const auto& d : devices) {
        if (d.id == id) {
            out = d;
            return true;
        }
    }
    return false;
}


SampleSource::SampleSource(AudioBackend& backend, SampleRing& ring, SourceOptions opts)
    : backend_(backend), ring_(ring), opts_(opts)
{
}

SampleSource::~SampleSource() {
    close();
}

std::vector<Device> SampleSource::enumerate() {
    std::lock_guard<std::mutex> lock(mtx);
    return backend_.enumerate();
}

DeviceError SampleSource::open(int device_id) {
    std::lock_guard<std::mutex> lock(mtx);
    close_locked();
    DeviceError err = open_locked(device_id);
    if (open_.load(std::memory_order_relaxed)) {
        failed_.store(false, std::memory_order_release);
        interrupted_ = false;
    }
    return err;
}

DeviceError SampleSource::switch_to(int device_id) {
    std::lock_guard<std::mutex> lock(mtx);

    Device previous = last_good_;

    close_locked();             // producer stopped
    ring_.request_flush();      // old device samples never reach the analyzer

    DeviceError err = open_locked(device_id);

    if (!open_.load(std::memory_order_relaxed) && previous.id >= 0) {
        std::cerr << "Failed to switch to device " << device_id
                  << ". Trying to restart with previous device." << std::endl;
        if (open_device(previous)) {
            std::cerr << "Restored previous audio device." << std::endl;
        } else {
            std::cerr << "Could not restore previous audio device." << std::endl;
        }
    }

    if (open_.load(std::memory_order_relaxed)) {
        failed_.store(false, std::memory_order_release);
        interrupted_ = false;
        attempts_ = 0;
    }
    last_error_ = err;
    return err;
}

void SampleSource::poll(std::chrono::steady_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mtx);

    if (failed_.load(std::memory_order_relaxed)) return;

    if (open_.load(std::memory_order_relaxed)) {
        if (backend_.is_active()) return;

        // Stream died under us
        std::cerr << "Audio stream interrupted on '" << current_.name << "'" << std::endl;
        close_locked();
        ring_.request_flush();
        interrupted_ = true;
        attempts_ = 0;
        backoff_ = opts_.first_retry;
        next_retry_ = now + backoff_;
        last_error_ = DeviceError::StreamInterrupted;
        return;
    }

    if (!interrupted_ || now < next_retry_) return;

    attempts_++;

    // Last known good first, then whatever the default is now
    bool ok = last_good_.id >= 0 && open_device(last_good_);
    if (!ok) {
        std::vector<Device> devices = backend_.enumerate();
        Device def;
        if (find_device(devices, backend_.default_device(), def)) {
            ok = open_device(def);
        }
    }

    if (ok) {
        std::cerr << "Reopened audio device '" << current_.name << "' after "
                  << attempts_ << " attempt(s)" << std::endl;
        interrupted_ = false;
        attempts_ = 0;
        last_error_ = DeviceError::None;
        return;
    }

    if (attempts_ >= opts_.max_attempts) {
        std::cerr << "Audio capture failed after " << attempts_
                  << " attempts. Spectrum frozen." << std::endl;
        failed_.store(true, std::memory_order_release);
        return;
    }

    backoff_ = std::min(backoff_ * 2, opts_.max_retry);
    next_retry_ = now + backoff_;
}

void SampleSource::close() {
    std::lock_guard<std::mutex> lock(mtx);
    close_locked();
}

DeviceError SampleSource::last_error() const {
    std::lock_guard<std::mutex> lock(mtx);
    return last_error_;
}

Device SampleSource::current() const {
    std::lock_guard<std::mutex> lock(mtx);
    return current_;
}

uint64_t SampleSource::input_overflows() const {
    std::lock_guard<std::mutex> lock(mtx);
    return backend_.input_overflows();
}

DeviceError SampleSource::open_locked(int device_id) {
    std::vector<Device> devices = backend_.enumerate();
    int def_id = backend_.default_device();
    if (device_id < 0) device_id = def_id;

    Device d;
    if (find_device(devices, device_id, d) && open_device(d)) {
        last_error_ = DeviceError::None;
        return DeviceError::None;
    }

    std::cerr << "Audio device " << device_id << " unavailable, falling back to default" << std::endl;

    if (def_id != device_id && find_device(devices, def_id, d) && open_device(d)) {
        std::cerr << "Using default audio device '" << d.name << "'" << std::endl;
    } else {
        std::cerr << "No default input device available" << std::endl;
    }

    last_error_ = DeviceError::DeviceUnavailable;
    return DeviceError::DeviceUnavailable;
}

bool SampleSource::open_device(const Device& dev) {
    dc_.reset();    // stream is stopped, callback not running

    if (backend_.open(dev, &SampleSource::on_capture, this) != DeviceError::None) {
        return false;
    }
    if (backend_.start() != DeviceError::None) {
        backend_.close();
        return false;
    }

    current_ = dev;
    last_good_ = dev;
    sample_rate_.store((int)dev.sample_rate, std::memory_order_release);
    open_.store(true, std::memory_order_release);
    return true;
}

void SampleSource::close_locked() {
    if (!open_.load(std::memory_order_relaxed)) return;
    backend_.stop();        // returns after the last callback
    backend_.close();
    open_.store(false, std::memory_order_release);
}

void SampleSource::on_capture(const float* input, unsigned long frames, int channels, void* user) {
    auto* self = reinterpret_cast<SampleSource*>(user);

    for (unsigned long f = 0; f < frames; ++f) {
        float s = 0.0f;                                 // null input: driver underrun, push silence
        if (input && channels > 0) {
            s = downmix(input + f * channels, channels);
        }
        if (self->opts_.dc_block) {
            s = self->dc_.push(s);
        }
        self->ring_.push(s);                            // full ring counts the drop
    }

    self->frames_.fetch_add(frames, std::memory_order_relaxed);
}
