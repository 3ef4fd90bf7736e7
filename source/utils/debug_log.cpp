#include "utils/debug_log.hpp"

#include <cstdlib>
#include <cctype>
#include <iostream>
#include <algorithm>
#include <mutex>
#include <string>

namespace debug_log {

// Watcher threads and command workers log concurrently.
static std::mutex stderr_mutex;

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

bool is_debug_enabled() {
    const char *value = std::getenv("GDSJAMD_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

void log(const std::string &message) {
    if (!is_debug_enabled()) {
        return;
    }
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << "[gdsjamd] " << message << std::endl;
}

void info(const std::string &message) {
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << "[gdsjamd] " << message << std::endl;
}

void error(const std::string &message) {
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << "[gdsjamd] error: " << message << std::endl;
}

} // namespace debug_log
