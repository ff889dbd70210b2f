#include "dt/config.hpp"

#include <cstdlib>
#include <exception>
#include <sstream>
#include <string>

namespace dt {

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

template <typename T, typename Parse>
void read_number(const char* name, T& out, Parse parse, std::ostringstream& warnings) {
    const char* value = env(name);
    if (value == nullptr) {
        return;
    }
    try {
        out = static_cast<T>(parse(value));
    } catch (const std::exception&) {
        warnings << name << "='" << value << "' is not a number, keeping " << out << "\n";
    }
}

} // namespace

bot_config load_config_from_env(std::string& warnings) {
    bot_config cfg;
    std::ostringstream problems;

    if (const char* token = env("token")) {
        cfg.token = token;
    } else {
        problems << "token is not set\n";
    }

    cfg.lavalink.host       = "127.0.0.1";
    cfg.lavalink.port       = 2333;
    cfg.lavalink.https      = false;
    cfg.lavalink.password   = "youshallnotpass";
    cfg.lavalink.session_id = "default";

    if (const char* host = env("LAVALINK_HOST")) {
        cfg.lavalink.host = host;
    }
    read_number("LAVALINK_PORT", cfg.lavalink.port,
                [](const char* s) { return std::stoul(s); }, problems);
    if (const char* https = env("LAVALINK_HTTPS")) {
        const std::string v = https;
        cfg.lavalink.https = (v == "1" || v == "true" || v == "yes");
    }
    if (const char* password = env("LAVALINK_PASSWORD")) {
        cfg.lavalink.password = password;
    }
    if (const char* session = env("LAVALINK_SESSION")) {
        cfg.lavalink.session_id = session;
    }

    if (const char* stations = env("STATIONS_FILE")) {
        cfg.stations_file = stations;
    }
    read_number("PLAYER_POLL_SECONDS", cfg.player_poll_seconds,
                [](const char* s) { return std::stoul(s); }, problems);
    read_number("PLAYBACK_RETRY_CAP", cfg.session.playback_retry_cap,
                [](const char* s) { return std::stoi(s); }, problems);

    if (cfg.player_poll_seconds == 0) {
        problems << "PLAYER_POLL_SECONDS must be at least 1, using 1\n";
        cfg.player_poll_seconds = 1;
    }

    warnings = problems.str();
    return cfg;
}

} // namespace dt
