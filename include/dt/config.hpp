#pragma once

#include <cstdint>
#include <string>

#include "dt/lavalink/client.hpp"
#include "dt/session/controller.hpp"

namespace dt {

struct bot_config {
    std::string                 token;
    lavalink::node_config       lavalink;
    std::string                 stations_file = "stations.json";
    uint64_t                    player_poll_seconds = 2; // D++ timers tick in whole seconds
    session::controller_options session;
};

/// Reads the bot configuration from the environment. Unset variables keep
/// their defaults; malformed numbers are reported through `warnings` and
/// ignored.
///
///   token               Discord bot token (required)
///   LAVALINK_HOST       default 127.0.0.1
///   LAVALINK_PORT       default 2333
///   LAVALINK_HTTPS      "1"/"true" to use https
///   LAVALINK_PASSWORD   default youshallnotpass
///   LAVALINK_SESSION    default "default"
///   STATIONS_FILE       default stations.json
///   PLAYER_POLL_SECONDS default 2
///   PLAYBACK_RETRY_CAP  default 3
bot_config load_config_from_env(std::string& warnings);

} // namespace dt
