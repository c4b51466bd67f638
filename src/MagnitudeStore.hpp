#pragma once

#include <vector>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <algorithm>

struct SpectrumFrame {
    std::vector<float> bars;    // normalized [0,1], size = bar count
};

struct SmoothingParams {
    float attack = 1.0f;        // fraction of the rise applied per cycle, 1 = jump
    float decay_step = 0.05f;   // max fall per cycle
};

// Smoothed bar magnitudes shared between the analysis thread (publish)
// and the render loop (snapshot). Lock-free triple buffer: the writer fills
// its back slot and swaps it into the middle, the reader swaps the middle
// into its front slot when it is fresh. Neither side waits.
class MagnitudeStore {
public:
    explicit MagnitudeStore(size_t bars, SmoothingParams params = SmoothingParams())
        : params_(params) {
        reset(bars);
    }

    // Analysis thread only. Bars start at zero.
    void reset(size_t bars) {
        smoothed_.assign(bars, 0.0f);
        write_slot();
    }

    // Analysis thread only.
    void publish(const SpectrumFrame& raw) {
        if (raw.bars.size() != smoothed_.size()) {
            smoothed_.assign(raw.bars.size(), 0.0f);    // bar count changed, no carry over
        }

        for (size_t i = 0; i < smoothed_.size(); ++i) {
            float target = raw.bars[i];
            if (!std::isfinite(target)) target = 0.0f;
            target = std::clamp(target, 0.0f, 1.0f);

            float cur = smoothed_[i];
            if (target > cur) {
                cur += params_.attack * (target - cur);             // attack
            } else {
                cur = std::max(target, cur - params_.decay_step);   // decay
            }
            smoothed_[i] = std::clamp(cur, 0.0f, 1.0f);
        }

        write_slot();
    }

    // Render thread only. Always a complete frame from a single publish.
    SpectrumFrame snapshot() {
        if (middle_.load(std::memory_order_acquire) & kFresh) {
            int prev = middle_.exchange(front_, std::memory_order_acq_rel);
            front_ = prev & kIndexMask;
        }
        return slots_[front_];
    }

    // Analysis thread only. Length of the last published frame.
    size_t bar_count() const { return smoothed_.size(); }

    uint64_t generation() const { return generation_.load(std::memory_order_relaxed); }

    const SmoothingParams& params() const { return params_; }

    // Upper bound on cycles for a full-scale bar to reach zero with no input.
    // One extra cycle absorbs float rounding of the repeated subtraction.
    int decay_cycles() const {
        return (int)std::ceil(1.0f / params_.decay_step) + 1;
    }

private:
    void write_slot() {
        SpectrumFrame& slot = slots_[back_];
        slot.bars.assign(smoothed_.begin(), smoothed_.end());

        int prev = middle_.exchange(back_ | kFresh, std::memory_order_acq_rel);
        back_ = prev & kIndexMask;
        generation_.fetch_add(1, std::memory_order_relaxed);
    }

    static constexpr int kFresh = 4;
    static constexpr int kIndexMask = 3;

    SmoothingParams params_;
    std::vector<float> smoothed_;           // writer state
    SpectrumFrame slots_[3];
    int back_ = 2;                          // writer owned
    int front_ = 0;                         // reader owned
    std::atomic<int> middle_{1};
    std::atomic<uint64_t> generation_{0};
};
