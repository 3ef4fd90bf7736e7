// Tests for environment configuration, data directory resolution and
// path-to-text conversion.

#include "backend/backend_config.hpp"
#include "platform/platform_abi.hpp"
#include "bridge/bridge_stdio.hpp"
#include "utils/debug_log.hpp"
#include "utils/path_text.hpp"
#include "test_helpers.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace test_backend_config {

using test_helpers::report;

static const char *const CONFIG_VARIABLES[] = {
    "GDSJAMD_APP_ID", "GDSJAMD_DATA_DIR", "GDSJAMD_WATCH_MODE", "GDSJAMD_DIALOG", "GDSJAMD_WORKERS",
};

static void clear_config_environment() {
    for (const char *name : CONFIG_VARIABLES) {
        unsetenv(name);
    }
}

// Test: With no variables set, every field has its default.
static bool test_defaults() {
    clear_config_environment();
    auto config = backend_config::load_from_environment();
    return report(config.app_identifier == "com.gdsjam.app" &&
                      config.data_directory_override.empty() &&
                      config.watch_mode == backend_config::WatchMode::replace &&
                      config.dialog_preference == backend_config::DialogPreference::automatic &&
                      config.worker_count == 4 &&
                      config.debounce_window == std::chrono::milliseconds(500),
                  "Defaults apply when no GDSJAMD_* variables are set");
}

// Test: Valid values are picked up (case-insensitive for enumerations).
static bool test_values_from_environment() {
    clear_config_environment();
    setenv("GDSJAMD_APP_ID", "org.example.viewer", 1);
    setenv("GDSJAMD_DATA_DIR", "/var/tmp/viewer", 1);
    setenv("GDSJAMD_WATCH_MODE", "Legacy", 1);
    setenv("GDSJAMD_DIALOG", "KDIALOG", 1);
    setenv("GDSJAMD_WORKERS", "8", 1);

    auto config = backend_config::load_from_environment();
    clear_config_environment();
    return report(config.app_identifier == "org.example.viewer" &&
                      config.data_directory_override == "/var/tmp/viewer" &&
                      config.watch_mode == backend_config::WatchMode::legacy &&
                      config.dialog_preference == backend_config::DialogPreference::kdialog &&
                      config.worker_count == 8,
                  "Environment values override defaults");
}

// Test: Invalid values are ignored.
static bool test_invalid_values_ignored() {
    clear_config_environment();
    setenv("GDSJAMD_APP_ID", "../escape", 1);
    setenv("GDSJAMD_WATCH_MODE", "sometimes", 1);
    setenv("GDSJAMD_WORKERS", "12abc", 1);

    auto config = backend_config::load_from_environment();
    bool first = config.app_identifier == "com.gdsjam.app" &&
                 config.watch_mode == backend_config::WatchMode::replace &&
                 config.worker_count == 4;

    setenv("GDSJAMD_WORKERS", "0", 1);
    bool zero_rejected = backend_config::load_from_environment().worker_count == 4;
    setenv("GDSJAMD_WORKERS", "65", 1);
    bool too_many_rejected = backend_config::load_from_environment().worker_count == 4;

    clear_config_environment();
    return report(first && zero_rejected && too_many_rejected, "Invalid values keep the defaults");
}

// Test: The data directory follows XDG_DATA_HOME, then HOME, and the override wins.
static bool test_data_directory_resolution() {
    std::string saved_xdg = std::getenv("XDG_DATA_HOME") ? std::getenv("XDG_DATA_HOME") : "";
    std::string saved_home = std::getenv("HOME") ? std::getenv("HOME") : "";
    bool had_xdg = std::getenv("XDG_DATA_HOME") != nullptr;
    bool had_home = std::getenv("HOME") != nullptr;

    backend_config::BackendConfig config;

    setenv("XDG_DATA_HOME", "/xdg/data", 1);
    setenv("HOME", "/home/designer", 1);
    auto from_xdg = backend_config::resolve_data_directory(config);

    setenv("XDG_DATA_HOME", "relative/ignored", 1);
    auto from_home = backend_config::resolve_data_directory(config);

    unsetenv("XDG_DATA_HOME");
    unsetenv("HOME");
    auto unresolved = backend_config::resolve_data_directory(config);

    config.data_directory_override = "/explicit/dir";
    auto overridden = backend_config::resolve_data_directory(config);

    if (had_xdg) {
        setenv("XDG_DATA_HOME", saved_xdg.c_str(), 1);
    }
    if (had_home) {
        setenv("HOME", saved_home.c_str(), 1);
    }

    bool xdg_ok = report(from_xdg.success && from_xdg.path == "/xdg/data/com.gdsjam.app",
                         "XDG_DATA_HOME/<app id> is used when absolute");
    bool home_ok = report(from_home.success && from_home.path == "/home/designer/.local/share/com.gdsjam.app",
                          "Relative XDG_DATA_HOME falls back to HOME/.local/share/<app id>");
    bool unresolved_ok = report(!unresolved.success && !unresolved.error_message.empty(),
                                "Neither variable set is a resolution error");
    bool override_ok = report(overridden.success && overridden.path == "/explicit/dir",
                              "GDSJAMD_DATA_DIR override wins");
    return xdg_ok && home_ok && unresolved_ok && override_ok;
}

// Test: Valid UTF-8 passes through, invalid bytes become U+FFFD.
static bool test_path_text() {
    bool valid = path_text::is_valid_utf8("/home/d\xC3\xA9signer/r\xC3\xA9seau.gds") &&
                 path_text::to_lossy_utf8("/plain/path.gds") == "/plain/path.gds";
    bool overlong_rejected = !path_text::is_valid_utf8("\xC0\xAF");
    bool surrogate_rejected = !path_text::is_valid_utf8("\xED\xA0\x80");
    bool replaced = path_text::to_lossy_utf8("a\xFF" "b") == "a\xEF\xBF\xBD" "b" &&
                    path_text::to_lossy_utf8("x\xE2\x82") == "x\xEF\xBF\xBD\xEF\xBF\xBD";
    return report(valid && overlong_rejected && surrogate_rejected && replaced,
                  "path_text validates and lossily converts UTF-8");
}

// Test: Lifecycle and error lines written from several threads never interleave.
static bool test_stderr_lines_stay_whole() {
    static constexpr int LINES_PER_THREAD = 200;
    const std::string lifecycle_text(64, 'L');
    const std::string error_text(64, 'E');

    std::ostringstream captured;
    std::streambuf *original_buffer = std::cerr.rdbuf(captured.rdbuf());

    std::thread lifecycle_writer([&]() {
        for (int index = 0; index < LINES_PER_THREAD; ++index) {
            bridge_stdio::log_message(lifecycle_text);
        }
    });
    std::thread error_writer([&]() {
        for (int index = 0; index < LINES_PER_THREAD; ++index) {
            debug_log::error(error_text);
        }
    });
    lifecycle_writer.join();
    error_writer.join();
    std::cerr.rdbuf(original_buffer);

    std::istringstream lines(captured.str());
    std::string line;
    int lifecycle_count = 0;
    int error_count = 0;
    bool all_whole = true;
    while (std::getline(lines, line)) {
        if (line == "[gdsjamd] " + lifecycle_text) {
            lifecycle_count++;
        } else if (line == "[gdsjamd] error: " + error_text) {
            error_count++;
        } else {
            all_whole = false;
        }
    }
    return report(all_whole && lifecycle_count == LINES_PER_THREAD && error_count == LINES_PER_THREAD,
                  "Concurrent stderr lines are written whole");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_defaults();
    all_passed &= test_values_from_environment();
    all_passed &= test_invalid_values_ignored();
    all_passed &= test_data_directory_resolution();
    all_passed &= test_path_text();
    all_passed &= test_stderr_lines_stay_whole();
    return all_passed;
}

} // namespace test_backend_config
