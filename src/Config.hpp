#pragma once

#include <atomic>
#include <cstddef>

enum class ColorScheme {
    Rainbow,
    Blue,
    Green,
    Red,
    Purple,
    Cyan,
    Yellow
};

const char* color_scheme_name(ColorScheme c);

// Settings shared between the UI thread (writer) and the analysis thread
// (reader, once per cycle). Setters reject out-of-range values so the
// analyzer never sees an invalid configuration.
class Config {
public:
    static constexpr size_t kMinBars = 8;
    static constexpr size_t kMaxBars = 128;
    static constexpr size_t kBarStep = 8;
    static constexpr int kMinRefreshMs = 8;
    static constexpr int kMaxRefreshMs = 100;
    static constexpr int kRefreshStepMs = 4;
    static constexpr float kMinSensitivity = 0.1f;
    static constexpr float kMaxSensitivity = 10.0f;
    static constexpr float kSensitivityStep = 1.2f;

    size_t bar_count() const { return bar_count_.load(std::memory_order_acquire); }
    int refresh_ms() const { return refresh_ms_.load(std::memory_order_acquire); }
    float sensitivity() const { return sensitivity_.load(std::memory_order_acquire); }
    ColorScheme color_scheme() const { return color_.load(std::memory_order_acquire); }
    int device_id() const { return device_id_.load(std::memory_order_acquire); }

    bool set_bar_count(size_t n);
    bool set_refresh_ms(int ms);
    bool set_sensitivity(float s);
    void set_color_scheme(ColorScheme c) { color_.store(c, std::memory_order_release); }
    void set_device_id(int id) { device_id_.store(id, std::memory_order_release); }

    void increase_bar_count();
    void decrease_bar_count();
    void increase_refresh_rate();       // shorter interval
    void decrease_refresh_rate();       // longer interval
    void increase_sensitivity();
    void decrease_sensitivity();
    void next_color_scheme();

private:
    std::atomic<size_t> bar_count_{32};
    std::atomic<int> refresh_ms_{16};           // ~60 FPS
    std::atomic<float> sensitivity_{1.0f};
    std::atomic<ColorScheme> color_{ColorScheme::Rainbow};
    std::atomic<int> device_id_{-1};            // -1 = system default
};
