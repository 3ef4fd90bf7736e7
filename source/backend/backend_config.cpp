#include "backend/backend_config.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace backend_config {

static std::string read_environment(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr) {
        return "";
    }
    return std::string(value);
}

static std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return value;
}

BackendConfig load_from_environment() {
    BackendConfig config;

    std::string app_identifier = read_environment("GDSJAMD_APP_ID");
    if (!app_identifier.empty()) {
        if (app_identifier.find('/') != std::string::npos || app_identifier == "." || app_identifier == "..") {
            debug_log::error("Ignoring GDSJAMD_APP_ID '" + app_identifier + "': not a plain directory name");
        } else {
            config.app_identifier = app_identifier;
        }
    }

    config.data_directory_override = read_environment("GDSJAMD_DATA_DIR");

    std::string watch_mode = to_lower(read_environment("GDSJAMD_WATCH_MODE"));
    if (watch_mode == "legacy") {
        config.watch_mode = WatchMode::legacy;
    } else if (!watch_mode.empty() && watch_mode != "replace") {
        debug_log::error("Ignoring GDSJAMD_WATCH_MODE '" + watch_mode + "': expected replace or legacy");
    }

    std::string dialog = to_lower(read_environment("GDSJAMD_DIALOG"));
    if (dialog == "zenity") {
        config.dialog_preference = DialogPreference::zenity;
    } else if (dialog == "kdialog") {
        config.dialog_preference = DialogPreference::kdialog;
    } else if (!dialog.empty() && dialog != "auto") {
        debug_log::error("Ignoring GDSJAMD_DIALOG '" + dialog + "': expected zenity, kdialog or auto");
    }

    std::string workers = read_environment("GDSJAMD_WORKERS");
    if (!workers.empty()) {
        try {
            std::size_t parsed_length = 0;
            long worker_count = std::stol(workers, &parsed_length);
            if (parsed_length != workers.size() || worker_count < 1 ||
                worker_count > static_cast<long>(MAXIMUM_WORKER_COUNT)) {
                throw std::out_of_range("worker count");
            }
            config.worker_count = static_cast<std::size_t>(worker_count);
        } catch (const std::exception &) {
            debug_log::error("Ignoring GDSJAMD_WORKERS '" + workers + "': expected 1.." +
                             std::to_string(MAXIMUM_WORKER_COUNT));
        }
    }

    debug_log::log("config: app_id=" + config.app_identifier +
                   " watch_mode=" + watch_mode_name(config.watch_mode) +
                   " workers=" + std::to_string(config.worker_count));
    return config;
}

platform::DirectoryResult resolve_data_directory(const BackendConfig &config) {
    if (!config.data_directory_override.empty()) {
        platform::DirectoryResult result;
        result.success = true;
        result.path = config.data_directory_override;
        return result;
    }
    return platform::resolve_app_data_directory(config.app_identifier);
}

const char *watch_mode_name(WatchMode mode) {
    switch (mode) {
        case WatchMode::replace:
            return "replace";
        case WatchMode::legacy:
            return "legacy";
    }
    return "unknown";
}

} // namespace backend_config
