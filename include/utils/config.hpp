#ifndef TICKLER_CONFIG_HPP
#define TICKLER_CONFIG_HPP

#include <cstdint>
#include <string>

namespace tickler {

struct Config {
    std::string discord_token;
    std::string discord_api = "https://discord.com/api/v10";
    std::string data_dir = ".";
    std::string log_file;
    std::string log_level = "info";
    std::string default_timezone = "America/New_York";
    uint64_t tick_ms = 1000;
    std::string listen_address = "0.0.0.0";
    unsigned short listen_port = 8080;
    unsigned int io_threads = 2;
    std::string event_secret;

    // Reads the TICKLER_* environment variables. Returns false with a
    // description on a missing token or an unusable value.
    static bool fromEnvironment(Config& out, std::string* out_error = nullptr);

    // Accepts 1..65535.
    static bool parsePort(const std::string& text, unsigned short& out);
};

std::string trimEnvValue(std::string value);

} // namespace tickler

#endif // TICKLER_CONFIG_HPP
