#pragma once

#include <fftw3.h>
#include <vector>
#include <atomic>
#include <cstdint>
#include <utility>

#include "SampleRing.hpp"
#include "MagnitudeStore.hpp"

// Per-cycle inputs, read once from Config and SampleSource by the caller
struct AnalyzerSettings {
    size_t bar_count = 32;
    float sensitivity = 1.0f;
    int sample_rate = 48000;
    bool capture_failed = false;
};

enum class CycleResult {
    Published,      // new frame in the store
    Underflow,      // less than one window queued, store untouched
    Frozen          // capture failed or settings unusable, store untouched
};

// Half-open bin range [first, second) per bar
struct BandMap {
    std::vector<std::pair<int, int>> bands;
    int sample_rate = 0;
    int fft_size = 0;
    size_t bar_count = 0;

    bool matches(int fs, int n, size_t bars) const {
        return fs == sample_rate && n == fft_size && bars == bar_count;
    }
};

// Log-spaced bands between f_min and min(f_max, Nyquist). Bands are
// contiguous, never empty and never contain the DC bin.
BandMap build_band_map(int sample_rate, int fft_size, size_t bar_count,
                       float f_min = 20.0f, float f_max = 20000.0f);

class SpectralAnalyzer {
public:
    SpectralAnalyzer(int fft_size, MagnitudeStore& store);
    ~SpectralAnalyzer();

    SpectralAnalyzer(const SpectralAnalyzer&) = delete;
    SpectralAnalyzer& operator=(const SpectralAnalyzer&) = delete;

    // One analysis step: pop, window, transform, band, compress, publish.
    CycleResult process_cycle(SampleRing& ring, const AnalyzerSettings& settings);

    int bin_count() const { return N / 2 + 1; }

    const BandMap& band_map() const { return bands_; }
    const std::vector<float>& bin_magnitudes() const { return mag_; }
    const SpectrumFrame& last_raw() const { return raw_; }

    uint64_t underruns() const { return underruns_.load(std::memory_order_relaxed); }
    uint64_t skipped_samples() const { return skipped_.load(std::memory_order_relaxed); }

    // Display range of the compressed magnitude
    static constexpr float kDbFloor = -70.0f;
    static constexpr float kDbCeil = 0.0f;

private:
    int N;
    MagnitudeStore& store_;

    std::vector<float> window;
    float window_gain;
    std::vector<float> frame_;
    std::vector<float> mag_;
    BandMap bands_;
    SpectrumFrame raw_;

    float* in;
    fftwf_complex* out;
    fftwf_plan plan;

    std::atomic<uint64_t> underruns_{0};
    std::atomic<uint64_t> skipped_{0};
};
