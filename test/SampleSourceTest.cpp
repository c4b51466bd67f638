#include <iostream>
#include <vector>
#include <chrono>
#include <cmath>

#include "FakeBackend.hpp"
#include "../src/SampleRing.hpp"
#include "../src/SampleSource.hpp"
#include "../src/MagnitudeStore.hpp"
#include "../src/SpectralAnalyzer.hpp"

const int fs = 48000;
const int Nfft = 1024;


static std::vector<float> sine_block(float freq, float amp, int frames, int channels, int& phase) {
    std::vector<float> out(frames * channels);
    for (int i = 0; i < frames; i++, phase++) {
        float v = amp * std::sin(2.0f * 3.141592654f * freq * phase / fs);
        for (int c = 0; c < channels; c++) out[i * channels + c] = v;
    }
    return out;
}


int main() {
    std::cout << "[TEST] Starting SampleSource Test...\n";

    SourceOptions opts;
    opts.dc_block = false;      // raw sample values are checked below

    ////////////////////////////////////////////////////////
    // Enumerate and open
    ////////////////////////////////////////////////////////
    FakeBackend backend;
    backend.devices = {make_device(0, "Mic", fs, 1),
                       make_device(3, "Monitor of Speakers", fs, 2),
                       make_device(5, "USB Interface", 44100.0, 2)};
    backend.default_id = 0;

    SampleRing ring(1 << 14);
    SampleSource source(backend, ring, opts);

    if (source.enumerate().size() != 3) {
        std::cerr << "[FAIL] Enumerate lost devices!\n";
        return 1;
    }

    if (source.open(3) != DeviceError::None || !source.is_open() || source.current().id != 3) {
        std::cerr << "[FAIL] Could not open an available device!\n";
        return 1;
    }
    std::cout << "[PASS] Open requested device.\n";

    ////////////////////////////////////////////////////////
    // Stereo downmix
    ////////////////////////////////////////////////////////
    std::vector<float> stereo = {0.5f, -0.5f, 1.0f, 0.0f, -0.2f, -0.4f};
    backend.deliver(stereo.data(), 3);
    std::vector<float> got(3);
    if (!ring.pop_frame(got.data(), 3)
        || std::abs(got[0]) > 1e-6f || std::abs(got[1] - 0.5f) > 1e-6f || std::abs(got[2] + 0.3f) > 1e-6f) {
        std::cerr << "[FAIL] Channels not averaged to mono!\n";
        return 1;
    }

    // Null input block is silence, not a crash
    backend.deliver_null(4);
    std::vector<float> sil(4, 1.0f);
    if (!ring.pop_frame(sil.data(), 4) || sil[0] != 0.0f || sil[3] != 0.0f) {
        std::cerr << "[FAIL] Null input not treated as silence!\n";
        return 1;
    }
    std::cout << "[PASS] Downmix.\n";

    ////////////////////////////////////////////////////////
    // Unknown device falls back to default
    ////////////////////////////////////////////////////////
    if (source.open(42) != DeviceError::DeviceUnavailable) {
        std::cerr << "[FAIL] Unknown device not reported!\n";
        return 1;
    }
    if (!source.is_open() || source.current().id != 0) {
        std::cerr << "[FAIL] Did not fall back to default device!\n";
        return 1;
    }
    std::cout << "[PASS] Fallback to default.\n";

    ////////////////////////////////////////////////////////
    // Switch: no stale samples reach the next frame
    ////////////////////////////////////////////////////////
    MagnitudeStore store(16);
    SpectralAnalyzer analyzer(Nfft, store);
    AnalyzerSettings s;
    s.bar_count = 16;
    s.sample_rate = fs;

    int phase = 0;
    source.switch_to(3);
    std::vector<float> old_block = sine_block(8000.0f, 0.8f, Nfft, 2, phase);
    backend.deliver(old_block.data(), Nfft);
    if (analyzer.process_cycle(ring, s) != CycleResult::Published) {
        std::cerr << "[FAIL] Old device window not analyzed!\n";
        return 1;
    }
    int band_8k = -1, band_200 = -1;
    for (size_t b = 0; b < analyzer.band_map().bands.size(); b++) {
        const auto& band = analyzer.band_map().bands[b];
        int k8 = (int)std::lround(8000.0f * Nfft / fs);
        int k2 = (int)std::lround(200.0f * Nfft / fs);
        if (k8 >= band.first && k8 < band.second) band_8k = (int)b;
        if (k2 >= band.first && k2 < band.second) band_200 = (int)b;
    }
    std::cout << "[INFO] 8 kHz band " << band_8k << " = " << analyzer.last_raw().bars[band_8k] << "\n";

    // Unconsumed samples from the old device sit in the ring when the user switches
    old_block = sine_block(8000.0f, 0.8f, Nfft / 2, 2, phase);
    backend.deliver(old_block.data(), Nfft / 2);

    if (source.switch_to(0) != DeviceError::None || source.current().id != 0) {
        std::cerr << "[FAIL] Switch to device 0 failed!\n";
        return 1;
    }

    int phase_new = 0;
    std::vector<float> new_block = sine_block(200.0f, 0.8f, Nfft, 1, phase_new);
    backend.deliver(new_block.data(), Nfft);

    if (analyzer.process_cycle(ring, s) != CycleResult::Published) {
        std::cerr << "[FAIL] New device window not analyzed!\n";
        return 1;
    }
    const SpectrumFrame& after = analyzer.last_raw();
    std::cout << "[INFO] After switch: 200 Hz band " << after.bars[band_200]
              << " | 8 kHz band " << after.bars[band_8k] << "\n";
    if (after.bars[band_8k] > 0.05f || !(after.bars[band_200] > 0.5f)) {
        std::cerr << "[FAIL] Stale samples from the old device leaked into the frame!\n";
        return 1;
    }
    std::cout << "[PASS] Switch drains old device.\n";

    ////////////////////////////////////////////////////////
    // Switch to a broken device: default takes over
    ////////////////////////////////////////////////////////
    source.switch_to(3);
    backend.broken.insert(5);
    if (source.switch_to(5) != DeviceError::DeviceUnavailable || !source.is_open()
        || source.current().id != 0) {
        std::cerr << "[FAIL] Broken device switch did not fall back!\n";
        return 1;
    }

    // Default also broken: previous device is restored
    source.switch_to(3);
    backend.broken.insert(0);
    if (source.switch_to(5) != DeviceError::DeviceUnavailable || !source.is_open()
        || source.current().id != 3) {
        std::cerr << "[FAIL] Previous device not restored!\n";
        return 1;
    }
    backend.broken.clear();
    std::cout << "[PASS] Switch failure recovery.\n";

    ////////////////////////////////////////////////////////
    // Disconnect: reopen with backoff
    ////////////////////////////////////////////////////////
    using clock = std::chrono::steady_clock;
    auto t = clock::now();

    source.switch_to(3);
    backend.active = false;             // stream died, device still present
    source.poll(t);
    if (source.is_open() || source.last_error() != DeviceError::StreamInterrupted) {
        std::cerr << "[FAIL] Interruption not detected!\n";
        return 1;
    }
    source.poll(t + std::chrono::milliseconds(100));   // before first retry
    if (source.is_open()) {
        std::cerr << "[FAIL] Retried before backoff expired!\n";
        return 1;
    }
    source.poll(t + std::chrono::milliseconds(300));
    if (!source.is_open() || source.current().id != 3 || source.last_error() != DeviceError::None) {
        std::cerr << "[FAIL] Did not reopen last good device!\n";
        return 1;
    }
    std::cout << "[PASS] Reopen after interruption.\n";

    ////////////////////////////////////////////////////////
    // Repeated failure: persistent error, spectrum frozen
    ////////////////////////////////////////////////////////
    backend.disconnect(3);
    backend.broken.insert(0);           // default gone too
    t = clock::now();
    source.poll(t);

    int polls = 0;
    auto when = t;
    while (!source.failed() && polls < 50) {
        when += std::chrono::seconds(5);    // past any backoff
        source.poll(when);
        polls++;
    }
    std::cout << "[INFO] Attempts before giving up: " << polls << "\n";
    if (!source.failed() || polls != opts.max_attempts) {
        std::cerr << "[FAIL] Persistent error state not reached after " << opts.max_attempts << " attempts!\n";
        return 1;
    }

    s.capture_failed = source.failed();
    uint64_t gen = store.generation();
    if (analyzer.process_cycle(ring, s) != CycleResult::Frozen || store.generation() != gen) {
        std::cerr << "[FAIL] Spectrum not frozen after capture failure!\n";
        return 1;
    }

    // Explicit switch clears the failed state
    backend.broken.clear();
    if (source.switch_to(5) != DeviceError::None || source.failed()) {
        std::cerr << "[FAIL] Switch did not recover from failed state!\n";
        return 1;
    }
    if (source.sample_rate() != 44100) {
        std::cerr << "[FAIL] Sample rate not taken from the new device!\n";
        return 1;
    }
    std::cout << "[PASS] Persistent failure and recovery.\n";

    ////////////////////////////////////////////////////////
    // Device-side overruns are reported through the source
    ////////////////////////////////////////////////////////
    backend.overflows = 3;
    if (source.input_overflows() != 3) {
        std::cerr << "[FAIL] Device overruns not reported: " << source.input_overflows() << "\n";
        return 1;
    }
    std::cout << "[PASS] Device overruns.\n";

    ////////////////////////////////////////////////////////
    // DC offset removed, signal onset passes through
    ////////////////////////////////////////////////////////
    {
        FakeBackend dc_backend;
        dc_backend.devices = {make_device(0, "Mic", fs, 1)};
        dc_backend.default_id = 0;
        SampleRing dc_ring(1 << 14);
        SampleSource dc_source(dc_backend, dc_ring);     // default options, DC blocker on
        if (dc_source.open(-1) != DeviceError::None) {
            std::cerr << "[FAIL] DC test device did not open!\n";
            return 1;
        }

        std::vector<float> offset(8192, 1.0f);
        dc_backend.deliver(offset.data(), offset.size());
        std::vector<float> out(offset.size());
        if (!dc_ring.pop_frame(out.data(), out.size())) {
            std::cerr << "[FAIL] DC block not delivered!\n";
            return 1;
        }
        std::cout << "[INFO] DC step: first " << out[0] << " | last " << out.back() << "\n";
        // ~8 Hz corner: one time constant is about 1000 samples
        if (std::abs(out[0] - 1.0f) > 1e-6f || std::abs(out[1000] - 0.3677f) > 0.01f
            || std::abs(out.back()) > 1e-3f) {
            std::cerr << "[FAIL] DC offset not removed!\n";
            return 1;
        }
    }
    std::cout << "[PASS] DC blocker.\n";

    ////////////////////////////////////////////////////////
    // Nothing to open at all
    ////////////////////////////////////////////////////////
    FakeBackend empty;
    SampleRing ring2(1024);
    SampleSource none(empty, ring2, opts);
    if (none.open(-1) != DeviceError::DeviceUnavailable || none.is_open()) {
        std::cerr << "[FAIL] Open with no devices should fail!\n";
        return 1;
    }
    std::cout << "[PASS] No device.\n";

    std::cout << "[SUCCESS] All SampleSource Tests Passed.\n";
    return 0;
}
