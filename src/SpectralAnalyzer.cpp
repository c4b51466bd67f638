#include "SpectralAnalyzer.hpp"
#include "DspBlocks.hpp"

#include <cmath>
#include <numeric>
#include <algorithm>
#include <stdexcept>


BandMap build_band_map(int sample_rate, int fft_size, size_t bar_count, float f_min, float f_max) {
    BandMap map;
    map.sample_rate = sample_rate;
    map.fft_size = fft_size;
    map.bar_count = bar_count;
    map.bands.resize(bar_count);

    const int nbins = fft_size / 2 + 1;
    const float hz_per_bin = (float)sample_rate / (float)fft_size;
    const float hi = std::min(f_max, sample_rate / 2.0f);
    const float lo = std::min(f_min, hi);

    // Edge frequency -> bin, never DC, never past Nyquist
    auto edge_bin = [&](size_t b) {
        float f = lo * std::pow(hi / lo, (float)b / (float)bar_count);
        int k = (int)std::lround(f / hz_per_bin);
        return std::clamp(k, 1, nbins);
    };

    int prev_end = 1;
    for (size_t b = 0; b < bar_count; ++b) {
        int start = std::max(edge_bin(b), prev_end);
        int end = std::max(edge_bin(b + 1), start + 1);

        if (start >= nbins) {           // more bars than bins, repeat the top bin
            start = nbins - 1;
            end = nbins;
        }
        end = std::min(end, nbins);

        map.bands[b] = {start, end};
        prev_end = end;
    }
    return map;
}


SpectralAnalyzer::SpectralAnalyzer(int fft_size, MagnitudeStore& store)
    : N(fft_size), store_(store),
      window(hann_window(fft_size)),
      frame_(fft_size),
      mag_(fft_size / 2 + 1),
      in(nullptr), out(nullptr), plan(nullptr)
{
    if (N < 16 || (N & (N - 1)) != 0) {
        throw std::invalid_argument("FFT size must be a power of 2 (>= 16)");
    }

    // Scale so a full-scale sine reads ~1.0 after windowing
    window_gain = 2.0f / std::accumulate(window.begin(), window.end(), 0.0f);

    in = (float*)fftwf_malloc(sizeof(float) * N);
    out = (fftwf_complex*)fftwf_malloc(sizeof(fftwf_complex) * (N / 2 + 1));
    if (!in || !out) {
        fftwf_free(in);
        fftwf_free(out);
        throw std::runtime_error("fftwf_malloc failed");
    }

    plan = fftwf_plan_dft_r2c_1d(N, in, out, FFTW_MEASURE);
    if (!plan) {
        fftwf_free(in);
        fftwf_free(out);
        throw std::runtime_error("fftwf_plan_dft_r2c_1d failed");
    }
}

SpectralAnalyzer::~SpectralAnalyzer() {
    fftwf_destroy_plan(plan);
    fftwf_free(in);
    fftwf_free(out);
}

CycleResult SpectralAnalyzer::process_cycle(SampleRing& ring, const AnalyzerSettings& s) {
    // A new bar count takes effect even when no window is analyzed:
    // the store restarts from N zero bars
    if (s.bar_count > 0 && s.bar_count != store_.bar_count()) {
        store_.reset(s.bar_count);
        if (s.sample_rate > 0) {
            bands_ = build_band_map(s.sample_rate, N, s.bar_count);
        }
    }

    // Persistent capture failure freezes the last published spectrum
    if (s.capture_failed || s.bar_count == 0 || s.sample_rate <= 0) {
        return CycleResult::Frozen;
    }

    // Stay on the newest window if the consumer fell behind
    size_t skipped = ring.skip_to_latest((size_t)N);
    if (skipped) skipped_.fetch_add(skipped, std::memory_order_relaxed);

    if (!ring.pop_frame(frame_.data(), (size_t)N)) {
        underruns_.fetch_add(1, std::memory_order_relaxed);
        return CycleResult::Underflow;
    }

    // window + copy
    for (int i = 0; i < N; ++i) {
        in[i] = frame_[i] * window[i];
    }

    fftwf_execute(plan);

    // Magnitude of the non-redundant half
    const int nbins = N / 2 + 1;
    for (int k = 0; k < nbins; ++k) {
        float re = out[k][0];
        float im = out[k][1];
        mag_[k] = std::sqrt(re*re + im*im) * window_gain;
    }

    // Band layout is cached until sample rate, FFT size or bar count changes
    if (!bands_.matches(s.sample_rate, N, s.bar_count)) {
        bands_ = build_band_map(s.sample_rate, N, s.bar_count);
    }

    const float gain_db = 20.0f * std::log10(s.sensitivity > 0.0f ? s.sensitivity : 1.0f);

    raw_.bars.resize(s.bar_count);
    for (size_t b = 0; b < s.bar_count; ++b) {
        const auto& band = bands_.bands[b];
        float peak = 0.0f;
        for (int k = band.first; k < band.second; ++k) {
            peak = std::max(peak, mag_[k]);
        }
        float db = magnitude_db(peak) + gain_db;
        raw_.bars[b] = db_norm(db, kDbFloor, kDbCeil);
    }

    store_.publish(raw_);
    return CycleResult::Published;
}
