#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include "Config.hpp"
#include "MagnitudeStore.hpp"
#include "SampleSource.hpp"

struct UiAppConfig {
    Config* settings;
    std::atomic<bool>* running;
    int fft_size;

    std::function<uint64_t()> underrun_count;
};

class UiApp {
public:
    // Blocks until the user quits or *cfg.running goes false.
    static void Run(const UiAppConfig& cfg,
                    MagnitudeStore& spectrum,
                    SampleSource& source);
};
