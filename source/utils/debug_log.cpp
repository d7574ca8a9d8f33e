#include "utils/debug_log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace debug_log {

static std::atomic<bool> forced_enabled{false};
static std::mutex output_mutex;

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

bool parse_flag(const std::string &value) {
    std::string normalized = to_lower(value);
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

bool is_debug_enabled() {
    if (forced_enabled.load()) {
        return true;
    }
    const char *value = std::getenv("FSMCPS_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    return parse_flag(std::string(value));
}

void set_debug_enabled(bool enabled) {
    if (enabled) {
        forced_enabled.store(true);
    }
}

void log(const std::string &message) {
    if (!is_debug_enabled()) {
        return;
    }
    info(message);
}

void info(const std::string &message) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << "[fsmcps] " << message << std::endl;
}

} // namespace debug_log
