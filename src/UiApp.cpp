#include "UiApp.hpp"

#include <vector>
#include <string>
#include <chrono>
#include <thread>
#include <cstdio>
#include <cstring>
#include <algorithm>
#include <cmath>
#include <poll.h>
#include <termios.h>
#include <unistd.h>
#include <sys/ioctl.h>


// Raw-ish terminal for the lifetime of the UI: no echo, no line buffering,
// alternate screen, hidden cursor. ISIG stays on so Ctrl+C still raises SIGINT.
class TerminalGuard {
public:
    TerminalGuard() {
        is_tty = isatty(STDIN_FILENO) == 1;
        if (is_tty && tcgetattr(STDIN_FILENO, &saved) == 0) {
            termios raw = saved;
            raw.c_lflag &= ~(ICANON | ECHO);
            raw.c_cc[VMIN] = 0;
            raw.c_cc[VTIME] = 0;
            raw_mode = tcsetattr(STDIN_FILENO, TCSANOW, &raw) == 0;
        }
        std::fputs("\033[?1049h\033[?25l\033[2J", stdout);
        std::fflush(stdout);
    }

    ~TerminalGuard() {
        std::fputs("\033[0m\033[?25h\033[?1049l", stdout);
        std::fflush(stdout);
        if (raw_mode) {
            tcsetattr(STDIN_FILENO, TCSANOW, &saved);
        }
    }

    TerminalGuard(const TerminalGuard&) = delete;
    TerminalGuard& operator=(const TerminalGuard&) = delete;

    bool interactive() const { return is_tty; }

private:
    termios saved{};
    bool is_tty = false;
    bool raw_mode = false;
};


enum Key { KeyNone = 0, KeyEsc = 27 };

// Non-blocking read of one key. Escape sequences (arrows etc.) are swallowed.
static int ReadKey() {
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    if (poll(&pfd, 1, 0) <= 0 || !(pfd.revents & POLLIN)) return KeyNone;

    unsigned char buf[16];
    ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
    if (n <= 0) return KeyNone;
    if (buf[0] == 27) return n == 1 ? KeyEsc : KeyNone;
    return buf[0];
}

static void TerminalSize(int& cols, int& rows) {
    winsize ws{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        cols = ws.ws_col;
        rows = ws.ws_row;
    } else {
        cols = 80;
        rows = 24;
    }
}

// ANSI color escape for bar i of n
static std::string BarColor(ColorScheme scheme, size_t i, size_t n) {
    static const int rainbow[] = {196, 202, 208, 214, 220, 226, 190, 154, 118, 82, 46, 48,
                                  51, 45, 39, 33, 27, 57, 93, 129, 165, 201};
    const int rainbow_len = sizeof(rainbow) / sizeof(rainbow[0]);

    switch (scheme) {
        case ColorScheme::Rainbow: {
            int idx = n > 1 ? (int)(i * (rainbow_len - 1) / (n - 1)) : 0;
            return "\033[38;5;" + std::to_string(rainbow[idx]) + "m";
        }
        case ColorScheme::Blue:    return "\033[34m";
        case ColorScheme::Green:   return "\033[32m";
        case ColorScheme::Red:     return "\033[31m";
        case ColorScheme::Purple:  return "\033[35m";
        case ColorScheme::Cyan:    return "\033[36m";
        case ColorScheme::Yellow:  return "\033[33m";
    }
    return "\033[0m";
}

static std::string Centered(const std::string& text, int width) {
    std::string s = text.substr(0, std::max(0, width));
    int pad = std::max(0, (width - (int)s.size()) / 2);
    std::string line(pad, ' ');
    line += s;
    line.resize(width, ' ');
    return line;
}

static const char* kHelpLines[] = {
    "Keyboard Controls:",
    "",
    "h - Toggle this help",
    "q, Esc, Ctrl+C - Quit",
    "c - Change color scheme",
    "+ / = - Increase bars",
    "- / _ - Decrease bars",
    "r - Increase refresh rate",
    "R - Decrease refresh rate",
    "s - Switch audio source",
    "[ - Decrease sensitivity",
    "] - Increase sensitivity",
    "",
    "Press any key to close help",
};


// Cycle to the next enumerated device
static std::string SwitchSource(SampleSource& source, Config& settings) {
    std::vector<Device> devices = source.enumerate();
    if (devices.empty()) {
        return "No audio devices available to switch to.";
    }

    int cur = source.current().id;
    size_t idx = 0;
    for (size_t i = 0; i < devices.size(); i++) {
        if (devices[i].id == cur) { idx = i; break; }
    }
    const Device& next = devices[(idx + 1) % devices.size()];

    DeviceError err = source.switch_to(next.id);
    settings.set_device_id(source.current().id);

    if (err == DeviceError::None) {
        return "Switched to audio device: " + next.name;
    }
    if (source.is_open()) {
        return "Failed to switch to '" + next.name + "' (" + device_error_text(err)
               + "), using " + source.current().name;
    }
    return "Failed to switch to '" + next.name + "'. Audio may not be available.";
}


void UiApp::Run(const UiAppConfig& cfg, MagnitudeStore& spectrum, SampleSource& source) {
    TerminalGuard term;

    bool show_help = false;
    bool quit = false;
    std::string message;
    std::string screen;

    // Partial blocks for sub-row bar height
    static const char* blocks[] = {" ", "▁", "▂", "▃", "▄",
                                   "▅", "▆", "▇", "█"};

    while (!quit && cfg.running->load(std::memory_order_relaxed)) {
        auto frame_start = std::chrono::steady_clock::now();
        Config& settings = *cfg.settings;

        // Events
        if (term.interactive()) {
            int key;
            while ((key = ReadKey()) != KeyNone) {
                if (show_help) { show_help = false; continue; }    // any key closes help

                switch (key) {
                    case 'q': case KeyEsc: quit = true; break;
                    case 'h': case 'H': show_help = true; break;
                    case 'c': case 'C': settings.next_color_scheme(); break;
                    case '+': case '=': settings.increase_bar_count(); break;
                    case '-': case '_': settings.decrease_bar_count(); break;
                    case 'r': settings.increase_refresh_rate(); break;
                    case 'R': settings.decrease_refresh_rate(); break;
                    case '[': settings.decrease_sensitivity(); break;
                    case ']': settings.increase_sensitivity(); break;
                    case 's': case 'S': message = SwitchSource(source, settings); break;
                    default: break;
                }
            }
        }

        // Device supervision runs on the UI cadence
        source.poll(frame_start);
        if (source.failed()) {
            message = "Audio capture failed. Spectrum frozen, press 's' to pick a source.";
        }

        // Snapshot the latest smoothed bars
        SpectrumFrame spec = spectrum.snapshot();

        int cols, rows;
        TerminalSize(cols, rows);
        const int chart_rows = std::max(1, rows - 4);
        const size_t bars = std::max<size_t>(1, spec.bars.size());
        const int bar_width = std::max(1, (cols - 2) / (int)bars);
        const ColorScheme scheme = settings.color_scheme();

        screen.clear();
        screen += "\033[H\033[0m";

        // ---- Title ----
        screen += "\033[1;36m";
        screen += Centered("Audio Visualizer - Press 'h' for help", cols);
        screen += "\033[0m\r\n";

        char title[160];
        std::snprintf(title, sizeof(title), "Frequency Spectrum (%dHz) - %zu bars - %s scheme",
                      source.sample_rate(), spec.bars.size(), color_scheme_name(scheme));
        screen += Centered(title, cols);
        screen += "\r\n";

        // ---- Bars, top row first ----
        for (int r = chart_rows - 1; r >= 0; --r) {
            screen += ' ';
            int used = 1;
            for (size_t b = 0; b < spec.bars.size() && used + bar_width <= cols; ++b) {
                float h = spec.bars[b] * chart_rows;                // height in rows
                int eighths = (int)std::lround((h - r) * 8.0f);
                eighths = std::clamp(eighths, 0, 8);

                screen += BarColor(scheme, b, spec.bars.size());
                for (int w = 0; w < bar_width; ++w) screen += blocks[eighths];
                used += bar_width;
            }
            screen += "\033[0m\033[K\r\n";
        }

        // ---- Status ----
        Device dev = source.current();
        char status[512];
        std::snprintf(status, sizeof(status),
                      "Device: %s | Bars: %zu | FPS: %d | Sensitivity: %.1f | Frames: %llu | Drops: %llu | Overruns: %llu | Underruns: %llu | 'q' quit, 'h' help",
                      source.is_open() ? dev.name.c_str() : "No Device",
                      settings.bar_count(),
                      1000 / settings.refresh_ms(),
                      settings.sensitivity(),
                      (unsigned long long)spectrum.generation(),
                      (unsigned long long)source.dropped(),
                      (unsigned long long)source.input_overflows(),
                      (unsigned long long)(cfg.underrun_count ? cfg.underrun_count() : 0));
        screen += "\033[32m";
        screen += Centered(status, cols);
        screen += "\033[0m\r\n";
        screen += Centered(message, cols);
        screen += "\033[K";

        // ---- Help overlay ----
        if (show_help) {
            const int lines = sizeof(kHelpLines) / sizeof(kHelpLines[0]);
            const int box_w = std::clamp(cols - 2, 10, 40);
            const int top = std::max(1, (rows - lines - 2) / 2);
            const int left = std::max(1, (cols - box_w) / 2);

            for (int i = -1; i <= lines; ++i) {
                screen += "\033[" + std::to_string(top + i + 1) + ";" + std::to_string(left) + "H";
                screen += "\033[40;37m";
                if (i == -1 || i == lines) {
                    screen += std::string(box_w, '-');
                } else {
                    std::string line = std::string("| ") + kHelpLines[i];
                    line.resize(box_w - 1, ' ');
                    screen += line + "|";
                }
                screen += "\033[0m";
            }
        }

        std::fwrite(screen.data(), 1, screen.size(), stdout);
        std::fflush(stdout);

        // Refresh cadence is independent of the analysis thread
        std::this_thread::sleep_until(frame_start + std::chrono::milliseconds(settings.refresh_ms()));
    }
}
