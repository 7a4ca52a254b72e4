#include "../../include/utils/config.hpp"
#include "../../include/time/zoned_time.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>

namespace tickler {

namespace {

std::string envOr(const char* key, const std::string& fallback) {
    const char* raw = std::getenv(key);
    if (!raw) return fallback;
    std::string value = trimEnvValue(raw);
    return value.empty() ? fallback : value;
}

bool parseUnsigned(const std::string& text, uint64_t& out) {
    if (text.empty() || text[0] == '-' || text[0] == '+') return false;
    errno = 0;
    char* end = nullptr;
    const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') return false;
    out = static_cast<uint64_t>(value);
    return true;
}

bool fail(std::string* out_error, const std::string& message) {
    if (out_error) *out_error = message;
    return false;
}

} // namespace

std::string trimEnvValue(std::string value) {
    const char* whitespace = " \t\n\r";
    auto start = value.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return std::string();
    }
    auto end = value.find_last_not_of(whitespace);
    return value.substr(start, end - start + 1);
}

bool Config::parsePort(const std::string& text, unsigned short& out) {
    uint64_t value = 0;
    if (!parseUnsigned(trimEnvValue(text), value) || value == 0 ||
        value > std::numeric_limits<unsigned short>::max()) {
        return false;
    }
    out = static_cast<unsigned short>(value);
    return true;
}

bool Config::fromEnvironment(Config& out, std::string* out_error) {
    Config config;

    config.discord_token = envOr("TICKLER_DISCORD_TOKEN", "");
    if (config.discord_token.empty()) {
        return fail(out_error, "TICKLER_DISCORD_TOKEN is not set");
    }

    config.discord_api = envOr("TICKLER_DISCORD_API", config.discord_api);
    config.data_dir = envOr("TICKLER_DATA_DIR", config.data_dir);
    config.log_file = envOr("TICKLER_LOG_FILE", "");
    config.log_level = envOr("TICKLER_LOG_LEVEL", config.log_level);
    config.listen_address = envOr("TICKLER_LISTEN_ADDRESS", config.listen_address);
    config.event_secret = envOr("TICKLER_EVENT_SECRET", "");

    config.default_timezone = envOr("TICKLER_DEFAULT_TIMEZONE", config.default_timezone);
    if (!TimeZone::locate(config.default_timezone)) {
        return fail(out_error, "TICKLER_DEFAULT_TIMEZONE names an unknown zone: " + config.default_timezone);
    }

    const std::string tick = envOr("TICKLER_TICK_MS", "");
    if (!tick.empty()) {
        uint64_t value = 0;
        if (!parseUnsigned(tick, value) || value == 0) {
            return fail(out_error, "TICKLER_TICK_MS must be a positive integer");
        }
        config.tick_ms = value;
    }

    const std::string port = envOr("TICKLER_LISTEN_PORT", "");
    if (!port.empty() && !parsePort(port, config.listen_port)) {
        return fail(out_error, "TICKLER_LISTEN_PORT must be between 1 and 65535");
    }

    const std::string threads = envOr("TICKLER_IO_THREADS", "");
    if (!threads.empty()) {
        uint64_t value = 0;
        if (!parseUnsigned(threads, value) || value == 0 || value > 64) {
            return fail(out_error, "TICKLER_IO_THREADS must be between 1 and 64");
        }
        config.io_threads = static_cast<unsigned int>(value);
    }

    out = config;
    return true;
}

} // namespace tickler
