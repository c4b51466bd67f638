#include <iostream>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <atomic>
#include <thread>
#include <chrono>
#include <csignal>
#include <memory>
#include <stdexcept>
#include "Config.hpp"
#include "SampleRing.hpp"
#include "MagnitudeStore.hpp"
#include "SpectralAnalyzer.hpp"
#include "SampleSource.hpp"
#include "PortAudioBackend.hpp"
#include "UiApp.hpp"


std::atomic<bool> running{true};


//Ctrl-C signal handler
void ctrlC_Invoked(int s)
{
    running.store(false, std::memory_order_relaxed);
}

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "  --list-devices      list capture devices and exit\n"
              << "  --device <id>       capture device id (default: system default)\n"
              << "  --bars <n>          number of bars, 1.." << Config::kMaxBars << " (default 32)\n"
              << "  --sensitivity <x>   gain, " << Config::kMinSensitivity << ".." << Config::kMaxSensitivity << " (default 1.0)\n"
              << "  --refresh <ms>      UI refresh interval, " << Config::kMinRefreshMs << ".." << Config::kMaxRefreshMs << " (default 16)\n"
              << "  --fft <n>           FFT window, power of 2, 256..16384 (default 2048)\n"
              << "  --help              show this text\n";
}

// Whole-string integer parse
static bool parse_long(const char* s, long& out) {
    char* end = nullptr;
    out = std::strtol(s, &end, 10);
    return end != s && *end == '\0';
}

static bool parse_double(const char* s, double& out) {
    char* end = nullptr;
    out = std::strtod(s, &end);
    return end != s && *end == '\0';
}


int main(int argc, char* argv[]) {

    // ctrl+c signal handler
    std::signal(SIGINT, ctrlC_Invoked);
    std::signal(SIGTERM, ctrlC_Invoked);

    // Parse arguments
    Config config;
    bool list_devices = false;
    long fft_size = 2048;

    for (int i = 1; i < argc; i++) {
        const bool has_value = i + 1 < argc;
        long n = 0;
        double x = 0.0;

        if (std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        else if (std::strcmp(argv[i], "--list-devices") == 0) {
            list_devices = true;
        }
        else if (std::strcmp(argv[i], "--device") == 0 && has_value) {
            if (!parse_long(argv[++i], n) || n < -1) {
                std::cerr << "Invalid --device value: " << argv[i] << "\n";
                return 1;
            }
            config.set_device_id((int)n);
        }
        else if (std::strcmp(argv[i], "--bars") == 0 && has_value) {
            if (!parse_long(argv[++i], n) || n < 1 || !config.set_bar_count((size_t)n)) {
                std::cerr << "Invalid --bars value: " << argv[i] << "\n";
                return 1;
            }
        }
        else if (std::strcmp(argv[i], "--sensitivity") == 0 && has_value) {
            if (!parse_double(argv[++i], x) || !config.set_sensitivity((float)x)) {
                std::cerr << "Invalid --sensitivity value: " << argv[i] << "\n";
                return 1;
            }
        }
        else if (std::strcmp(argv[i], "--refresh") == 0 && has_value) {
            if (!parse_long(argv[++i], n) || !config.set_refresh_ms((int)n)) {
                std::cerr << "Invalid --refresh value: " << argv[i] << "\n";
                return 1;
            }
        }
        else if (std::strcmp(argv[i], "--fft") == 0 && has_value) {
            if (!parse_long(argv[++i], fft_size) || fft_size < 256 || fft_size > 16384
                || (fft_size & (fft_size - 1)) != 0) {
                std::cerr << "Invalid --fft value: " << argv[i] << "\n";
                return 1;
            }
        }
        else {
            std::cerr << "Unknown or incomplete option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    ////////////////////////////////////////////////////////
    // Initialization
    ////////////////////////////////////////////////////////

    std::unique_ptr<PortAudioBackend> backend;
    try {
        backend.reset(new PortAudioBackend());
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    // Detect capture devices and print
    std::vector<Device> devices = backend->enumerate();
    std::cout << "Capture devices found: " << devices.size() << "\n";
    for (const auto& d : devices) {
        std::cout << "  [" << d.id << "] " << d.name
                  << " (" << d.sample_rate << " Hz, " << d.channels << " ch)\n";
    }
    if (list_devices) return 0;

    // Sample ring: power of two, several FFT windows deep
    size_t ring_size = 1 << 16;
    while (ring_size < (size_t)fft_size * 4) ring_size <<= 1;

    SampleRing ring(ring_size);
    MagnitudeStore store(config.bar_count());
    SpectralAnalyzer analyzer((int)fft_size, store);
    SampleSource source(*backend, ring);

    // Open device, falls back to default
    DeviceError err = source.open(config.device_id());
    if (!source.is_open()) {
        std::cerr << "Could not open any audio input device: " << device_error_text(err) << "\n";
        return 1;
    }
    if (err != DeviceError::None) {
        std::cerr << "Warning: " << device_error_text(err) << ", using default device\n";
    }
    config.set_device_id(source.current().id);
    std::cout << "Capturing from '" << source.current().name << "' at "
              << source.sample_rate() << " Hz" << std::endl;

    ///////////////////////////////////
    // Analysis thread
    ///////////////////////////////////
    std::atomic<bool> analysis_running{true};

    std::thread analysis([&] {
        while (analysis_running.load(std::memory_order_acquire)) {

            // Settings are read once per cycle
            AnalyzerSettings s;
            s.bar_count = config.bar_count();
            s.sensitivity = config.sensitivity();
            s.sample_rate = source.sample_rate();
            s.capture_failed = source.failed();

            // Cadence bounded by available samples, each 1 ms wait is an underrun
            CycleResult r = analyzer.process_cycle(ring, s);
            if (r != CycleResult::Published) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }
    });


    // Blocks until the user quits
    UiAppConfig cfg;
    cfg.settings = &config;
    cfg.running = &running;
    cfg.fft_size = (int)fft_size;
    cfg.underrun_count = [&] { return analyzer.underruns(); };

    UiApp::Run(cfg, store, source);

    // Stop producer first, then let the analyzer finish its cycle
    source.close();

    analysis_running.store(false, std::memory_order_release);
    analysis.join();

    std::cout << "Captured frames: " << source.frames_captured()
              << " | Dropped samples: " << source.dropped()
              << " | Device overruns: " << source.input_overflows()
              << " | Analysis underruns: " << analyzer.underruns()
              << " | Skipped (lag) samples: " << analyzer.skipped_samples() << std::endl;

    return 0;
}
