// =============================================================================
// show_usage_text.cpp - Terminal version of the Pinch usage monitor
// =============================================================================
// No GUI dependencies - only libcurl and nlohmann/json.
// =============================================================================

#include "usage_common.h"
#include "credentials.h"
#include "settings.h"
#include "usage_evaluator.h"
#include "usage_monitor.h"
#include "usage_text.h"

#include <sys/ioctl.h>
#include <clocale>
#include <signal.h>
#include <algorithm>

// ============================================================================
// Terminal UI - Cursor Control
// ============================================================================

static volatile sig_atomic_t g_cursor_hidden = 0;

static void cursor_hide_raw() {
    static const char kHide[] = "\033[?25l";
    (void)!write(STDOUT_FILENO, kHide, sizeof(kHide) - 1);
}

static void cursor_show_raw() {
    static const char kShow[] = "\033[?25h";
    (void)!write(STDOUT_FILENO, kShow, sizeof(kShow) - 1);
}

static void show_cursor_if_hidden() {
    if (g_cursor_hidden) {
        cursor_show_raw();
        g_cursor_hidden = 0;
    }
}

static void hide_cursor_if_tty() {
    if (!isatty(STDOUT_FILENO)) {
        return;
    }
    if (!g_cursor_hidden) {
        cursor_hide_raw();
        g_cursor_hidden = 1;
    }
}

static void handle_term_signal(int sig) {
    if (g_cursor_hidden) {
        cursor_show_raw();
        g_cursor_hidden = 0;
    }
    _exit(128 + sig);
}

// ============================================================================
// Terminal UI - Utilities
// ============================================================================

static int get_terminal_width() {
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return w.ws_col;
    }
    return 80;
}

static bool is_utf8_locale() {
    std::setlocale(LC_CTYPE, "");

    const char* locale = std::setlocale(LC_CTYPE, nullptr);
    if (locale) {
        std::string loc(locale);
        return loc.find("UTF-8") != std::string::npos ||
               loc.find("utf8") != std::string::npos;
    }

    const char* lang = std::getenv("LANG");
    if (lang) {
        std::string lang_str(lang);
        return lang_str.find("UTF-8") != std::string::npos ||
               lang_str.find("utf8") != std::string::npos;
    }

    return false;
}

// ============================================================================
// Terminal UI - Rendering
// ============================================================================

static std::string render_progress_bar(const BucketView& v, int terminal_width, bool use_colors) {
    // "5-Hour Rolling  [" + bar + "] 100%  in 4h 59m"
    int fixed_width = 42;
    int bar_width = terminal_width - fixed_width;
    if (bar_width < 10) {
        bar_width = 10;
    }
    if (bar_width > 40) {
        bar_width = 40;
    }

    int filled = static_cast<int>((v.percent / 100.0) * bar_width);
    if (filled < 0) filled = 0;
    if (filled > bar_width) filled = bar_width;
    int empty = bar_width - filled;

    bool use_utf8 = is_utf8_locale();
    std::string filled_char = use_utf8 ? "█" : "#";
    std::string empty_char = use_utf8 ? "░" : "-";

    std::ostringstream bar;
    bar << std::left << std::setw(16) << bucket_label(v.kind) << "[" << color_for_severity(v.severity, use_colors);
    for (int i = 0; i < filled; i++) {
        bar << filled_char;
    }
    for (int i = 0; i < empty; i++) {
        bar << empty_char;
    }
    bar << color_reset(use_colors) << "] " << std::right << std::setw(3) << v.percent << "%";
    if (v.has_reset) {
        bar << "  " << (v.countdown_seconds > 0 ? "in " : "") << format_duration_compact(v.countdown_seconds);
    }
    return bar.str();
}

static void print_state(const DisplayState& s, bool text_mode, bool tiny_mode, bool use_colors, int terminal_width) {
    if (tiny_mode) {
        std::cout << render_tiny_line(s, use_colors) << std::endl;
        return;
    }

    std::cout << "Pinch Usage" << std::endl;
    std::cout << "===========" << std::endl;

    if (s.status != DisplayStatus::Live) {
        std::cout << color_for_severity(Severity::Warn, use_colors) << "Status: " << display_status_name(s.status)
                  << " - " << s.message << color_reset(use_colors) << std::endl;
    }

    if (!s.has_data) {
        return;
    }

    for (BucketKind kind : kAllBucketKinds) {
        const BucketView& v = s.bucket(kind);
        if (kind == BucketKind::ExtraCredit) {
            std::cout << render_extra_line(v, use_colors) << std::endl;
        } else if (text_mode) {
            std::cout << render_bucket_text(v) << std::endl;
        } else {
            std::cout << render_progress_bar(v, terminal_width, use_colors) << std::endl;
        }
    }

    std::cout << "Overall:        " << color_for_severity(s.severity, use_colors) << severity_name(s.severity)
              << color_reset(use_colors) << std::endl;
    std::cout << "Updated:        " << format_local_time(s.fetched_at) << std::endl;
}

// ============================================================================
// Main Logic
// ============================================================================

static void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS]" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Shows quota usage for the signed-in claude CLI account." << std::endl;
    std::cerr << std::endl;
    std::cerr << "Options:" << std::endl;
    std::cerr << "  --test-api           Fetch once, print every bucket and exit (1 on failure)" << std::endl;
    std::cerr << "  --refresh <seconds>  Refresh continuously every N seconds (15-120, default from settings)" << std::endl;
    std::cerr << "  -1                   Single run (no refresh loop)" << std::endl;
    std::cerr << "  --text               Pure text output (no progress bars)" << std::endl;
    std::cerr << "  --tiny               Extra small single-line output: XX% 2h14m" << std::endl;
    std::cerr << "  --credentials <file> Credentials file (default: ~/.claude/.credentials.json)" << std::endl;
    std::cerr << "  --verbose            Log to stderr, including debug messages" << std::endl;
    std::cerr << "  --help               Show this help message" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Environment:" << std::endl;
    std::cerr << "  PINCH_CREDENTIALS    Overrides the credentials file path" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Examples:" << std::endl;
    std::cerr << "  " << program_name << " --test-api" << std::endl;
    std::cerr << "  " << program_name << " --refresh 60" << std::endl;
    std::cerr << "  " << program_name << " --tiny --refresh 30" << std::endl;
}

// One fetch-and-print cycle. Never prints the token.
static int run_test_api(UsageMonitor& monitor) {
    std::cout << "Testing OAuth connection..." << std::endl;

    DisplayStatePtr s = monitor.poll_once(time(nullptr));
    if (!s || s->status != DisplayStatus::Live) {
        std::cout << "ERROR: " << (s ? s->message : std::string("no result")) << std::endl;
        return 1;
    }

    std::cout << std::endl;
    for (BucketKind kind : kAllBucketKinds) {
        const BucketView& v = s->bucket(kind);
        if (kind == BucketKind::ExtraCredit) {
            std::cout << render_extra_line(v, false) << std::endl;
        } else {
            std::cout << render_bucket_text(v) << std::endl;
        }
    }
    std::cout << "Overall:        " << severity_name(s->severity) << std::endl;
    std::cout << std::endl << "API test PASSED" << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    std::string credentials_path;
    int refresh_interval = -1;
    bool single_run = false;
    bool test_api = false;
    bool text_mode = false;
    bool tiny_mode = false;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--test-api") {
            test_api = true;
        } else if (arg == "-1") {
            single_run = true;
        } else if (arg == "--refresh" || arg == "-r") {
            if (i + 1 < argc) {
                refresh_interval = clamp_poll_interval(std::atoi(argv[++i]));
            } else {
                std::cerr << "Error: --refresh requires a number of seconds" << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        } else if (arg == "--text" || arg == "-t") {
            text_mode = true;
        } else if (arg == "--tiny") {
            tiny_mode = true;
        } else if (arg == "--credentials" || arg == "-c") {
            if (i + 1 < argc) {
                credentials_path = argv[++i];
            } else {
                std::cerr << "Error: --credentials requires a file path" << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    app_log_init("pinch", verbose);

    if (credentials_path.empty()) {
        credentials_path = default_credentials_path();
    }
    if (refresh_interval < 0) {
        refresh_interval = load_settings(default_settings_path()).poll_interval;
    }

    if (tiny_mode && !single_run && !test_api) {
        std::atexit(show_cursor_if_hidden);
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = handle_term_signal;
        sigemptyset(&sa.sa_mask);
        sigaction(SIGINT, &sa, nullptr);
        sigaction(SIGTERM, &sa, nullptr);
        hide_cursor_if_tty();
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    UsageMonitor monitor(file_credential_source(credentials_path), fetch_usage);

    int result = 0;
    if (test_api) {
        result = run_test_api(monitor);
    } else if (single_run) {
        DisplayStatePtr s = monitor.poll_once(time(nullptr));
        print_state(*s, text_mode, tiny_mode, isatty(STDOUT_FILENO), get_terminal_width());
        result = s->status == DisplayStatus::Live ? 0 : 1;
    } else {
        app_log(LogLevel::Info, "Usage monitor started (poll every %ds)", refresh_interval);
        while (true) {
            int terminal_width = get_terminal_width();
            bool use_colors = isatty(STDOUT_FILENO);

            if (use_colors) {
                std::cout << "\033[2J\033[H";
                std::cout.flush();
            }

            DisplayStatePtr s = monitor.poll_once(time(nullptr));
            print_state(*s, text_mode, tiny_mode, use_colors, terminal_width);

            if (!tiny_mode) {
                std::cout << std::endl << "Refreshing every " << refresh_interval << " seconds (Ctrl+C to stop)..." << std::endl;
            }
            std::cout.flush();

            // Sleep in one-second steps so an expired reset triggers an early poll.
            for (int waited = 0; waited < refresh_interval; ++waited) {
                sleep(1);
                bool refetch = false;
                monitor.tick(time(nullptr), &refetch);
                if (refetch) {
                    app_log(LogLevel::Info, "Reset time passed, polling early");
                    break;
                }
            }
        }
    }

    curl_global_cleanup();

    return result;
}
