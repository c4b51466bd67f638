#pragma once

#include <vector>
#include <atomic>
#include <cstring>
#include <cstdint>
#include <cstddef>
#include <algorithm>
#include <stdexcept>

// Lock-free single-producer / single-consumer sample ring.
// Producer: capture callback. Consumer: analysis thread.
// Full ring drops the newest sample and counts it.
class SampleRing {
public:
    explicit SampleRing(size_t size) : buffer(size), mask(size - 1) {
        if (size == 0 || (size & mask) != 0) {
            throw std::invalid_argument("Ring size must be a power of 2");
        }
    }

    // Producer function
    bool push(float sample) {
        size_t h = head_.load(std::memory_order_relaxed);
        size_t t = tail_.load(std::memory_order_acquire);

        if (h - t == buffer.size()) {       // Full, drop newest
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        buffer[h & mask] = sample;
        head_.store(h + 1, std::memory_order_release);
        return true;
    }

    // Consumer function. Copies exactly n samples or nothing.
    bool pop_frame(float* out, size_t n) {
        apply_flush();

        size_t h = head_.load(std::memory_order_acquire);
        size_t t = tail_.load(std::memory_order_relaxed);

        if (n == 0 || h - t < n) return false;     // Insufficient

        size_t idx = t & mask;
        size_t first = std::min(n, buffer.size() - idx);

        std::memcpy(out, &buffer[idx], first * sizeof(float));
        std::memcpy(out + first, &buffer[0], (n - first) * sizeof(float));

        // A flush raised while copying means the frame may straddle two devices
        if (flush_req_.load(std::memory_order_acquire) != flush_seen_) {
            return false;
        }

        tail_.store(t + n, std::memory_order_release);
        return true;
    }

    // Consumer function. Drops everything except the newest keep samples.
    size_t skip_to_latest(size_t keep) {
        apply_flush();

        size_t h = head_.load(std::memory_order_acquire);
        size_t t = tail_.load(std::memory_order_relaxed);

        size_t available = h - t;
        if (available <= keep) return 0;

        size_t skipped = available - keep;
        tail_.store(t + skipped, std::memory_order_release);
        return skipped;
    }

    // Control thread, with the producer stopped. Samples queued before this
    // call never reach the consumer, samples pushed after it are kept.
    void request_flush() {
        flush_pos_.store(head_.load(std::memory_order_acquire), std::memory_order_relaxed);
        flush_req_.fetch_add(1, std::memory_order_acq_rel);
    }

    size_t read_available() const {
        size_t t = tail_.load(std::memory_order_relaxed);
        size_t h = head_.load(std::memory_order_acquire);
        return h - t;
    }

    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    void apply_flush() {
        uint64_t g = flush_req_.load(std::memory_order_acquire);
        if (g == flush_seen_) return;

        size_t pos = flush_pos_.load(std::memory_order_relaxed);
        size_t t = tail_.load(std::memory_order_relaxed);
        if ((std::ptrdiff_t)(pos - t) > 0) {
            tail_.store(pos, std::memory_order_release);
        }
        flush_seen_ = g;
    }

    std::vector<float> buffer;
    size_t mask;
    std::atomic<size_t> head_{0};
    std::atomic<size_t> tail_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> flush_req_{0};
    std::atomic<size_t> flush_pos_{0};
    uint64_t flush_seen_ = 0;               // consumer only
};
