#include "Config.hpp"

#include <algorithm>
#include <cmath>


const char* color_scheme_name(ColorScheme c) {
    switch (c) {
        case ColorScheme::Rainbow: return "Rainbow";
        case ColorScheme::Blue:    return "Blue";
        case ColorScheme::Green:   return "Green";
        case ColorScheme::Red:     return "Red";
        case ColorScheme::Purple:  return "Purple";
        case ColorScheme::Cyan:    return "Cyan";
        case ColorScheme::Yellow:  return "Yellow";
    }
    return "?";
}

bool Config::set_bar_count(size_t n) {
    if (n < 1 || n > kMaxBars) return false;
    bar_count_.store(n, std::memory_order_release);
    return true;
}

bool Config::set_refresh_ms(int ms) {
    if (ms < kMinRefreshMs || ms > kMaxRefreshMs) return false;
    refresh_ms_.store(ms, std::memory_order_release);
    return true;
}

bool Config::set_sensitivity(float s) {
    if (!std::isfinite(s) || s < kMinSensitivity || s > kMaxSensitivity) return false;
    sensitivity_.store(s, std::memory_order_release);
    return true;
}

void Config::increase_bar_count() {
    size_t n = bar_count();
    if (n < kMaxBars) bar_count_.store(std::min(n + kBarStep, kMaxBars), std::memory_order_release);
}

void Config::decrease_bar_count() {
    size_t n = bar_count();
    if (n > kMinBars) bar_count_.store(std::max(n - kBarStep, kMinBars), std::memory_order_release);
}

void Config::increase_refresh_rate() {
    int ms = refresh_ms();
    if (ms > kMinRefreshMs) refresh_ms_.store(std::max(ms - kRefreshStepMs, kMinRefreshMs), std::memory_order_release);
}

void Config::decrease_refresh_rate() {
    int ms = refresh_ms();
    if (ms < kMaxRefreshMs) refresh_ms_.store(std::min(ms + kRefreshStepMs, kMaxRefreshMs), std::memory_order_release);
}

void Config::increase_sensitivity() {
    sensitivity_.store(std::min(sensitivity() * kSensitivityStep, kMaxSensitivity), std::memory_order_release);
}

void Config::decrease_sensitivity() {
    sensitivity_.store(std::max(sensitivity() / kSensitivityStep, kMinSensitivity), std::memory_order_release);
}

void Config::next_color_scheme() {
    ColorScheme next = ColorScheme::Rainbow;
    switch (color_scheme()) {
        case ColorScheme::Rainbow: next = ColorScheme::Blue; break;
        case ColorScheme::Blue:    next = ColorScheme::Green; break;
        case ColorScheme::Green:   next = ColorScheme::Red; break;
        case ColorScheme::Red:     next = ColorScheme::Purple; break;
        case ColorScheme::Purple:  next = ColorScheme::Cyan; break;
        case ColorScheme::Cyan:    next = ColorScheme::Yellow; break;
        case ColorScheme::Yellow:  next = ColorScheme::Rainbow; break;
    }
    set_color_scheme(next);
}
