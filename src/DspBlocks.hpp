#pragma once

#include <vector>
#include <cmath>
#include <algorithm>

// Audio DC Blocker (High Pass)
struct DcBlocker {
    float y = 0.0f, x1 = 0.0f;
    float R = 0.999f;   // ~8 Hz corner at 48 kHz
    float push(float x) {
        float out = x - x1 + R * y;
        x1 = x;
        y = out;
        return out;
    }
    void reset() { y = 0.0f; x1 = 0.0f; }
};

// Average interleaved channels of one frame into a mono sample
inline float downmix(const float* frame, int channels) {
    float sum = 0.0f;
    for (int c = 0; c < channels; ++c) sum += frame[c];
    return sum / (float)channels;
}

// Hann taper, symmetric
inline std::vector<float> hann_window(int N) {
    std::vector<float> w(N, 1.0f);
    if (N < 2) return w;
    for (int n = 0; n < N; ++n)
        w[n] = 0.5f - 0.5f * std::cos(2.0f * 3.141592654f * n / (N - 1));
    return w;
}

// Linear magnitude -> dB, floor-clamped so log10 never sees 0
inline float magnitude_db(float mag, float floor_mag = 1e-9f) {
    return 20.0f * std::log10(std::max(mag, floor_mag));
}

// Map [db_min, db_max] onto [0,1] and clamp
inline float db_norm(float db, float db_min, float db_max) {
    float t = (db - db_min) / (db_max - db_min);
    return std::clamp(t, 0.0f, 1.0f);
}
