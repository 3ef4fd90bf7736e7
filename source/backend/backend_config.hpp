#ifndef GDSJAMD_BACKEND_CONFIG_HPP
#define GDSJAMD_BACKEND_CONFIG_HPP

// Backend configuration, read once from GDSJAMD_* environment variables.

#include <chrono>
#include <cstddef>
#include <string>

#include "platform/platform_abi.hpp"

namespace backend_config {

// How watch_file / unwatch_file treat watchers created by earlier calls.
enum class WatchMode {
    // Keep one active watcher; stop it on unwatch or before watching again.
    replace,
    // Keep every watcher running until exit; unwatch only clears the target.
    legacy,
};

// Which dialog program open_file_dialog tries first.
enum class DialogPreference {
    automatic,
    zenity,
    kdialog,
};

static const char DEFAULT_APP_IDENTIFIER[] = "com.gdsjam.app";
static constexpr std::chrono::milliseconds DEBOUNCE_WINDOW{500};
static constexpr std::size_t DEFAULT_WORKER_COUNT = 4;
static constexpr std::size_t MAXIMUM_WORKER_COUNT = 64;

struct BackendConfig {
    std::string app_identifier = DEFAULT_APP_IDENTIFIER;
    std::string data_directory_override; // empty = platform default
    WatchMode watch_mode = WatchMode::replace;
    DialogPreference dialog_preference = DialogPreference::automatic;
    std::size_t worker_count = DEFAULT_WORKER_COUNT;
    std::chrono::milliseconds debounce_window = DEBOUNCE_WINDOW;
};

// Read GDSJAMD_APP_ID, GDSJAMD_DATA_DIR, GDSJAMD_WATCH_MODE, GDSJAMD_DIALOG
// and GDSJAMD_WORKERS. Unset or invalid values keep their defaults; invalid
// ones are reported through debug_log.
BackendConfig load_from_environment();

// The data directory for this configuration: the override when set,
// otherwise the platform's application data directory.
platform::DirectoryResult resolve_data_directory(const BackendConfig &config);

const char *watch_mode_name(WatchMode mode);

} // namespace backend_config

#endif // GDSJAMD_BACKEND_CONFIG_HPP
