#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <dpp/dpp.h>
#include <dpp/json.h>

#include "dt/catalog/track.hpp"

namespace dt::lavalink {

using json = dpp::json;

struct node_config {
    std::string host;       // e.g. "127.0.0.1"
    uint16_t    port = 2333;
    bool        https = false;
    std::string password;   // Lavalink password
    std::string session_id; // Lavalink v4 session id, e.g. "default"
};

enum class load_type {
    track,
    playlist,
    search,
    empty,
    error
};

struct load_result {
    load_type                   type = load_type::empty;
    std::vector<catalog::track> tracks;
    std::string                 error_message; // for load_type::error
};

// What the node reports about a guild's player.
struct player_state {
    std::optional<catalog::track> track; // nullopt when nothing is loaded
    std::int64_t                  position_ms = 0;
};

class node {
public:
    node(dpp::cluster& cluster, const node_config& cfg);

    // Hook these from the bot:
    void handle_voice_state_update(const dpp::voice_state_update_t& ev);
    void handle_voice_server_update(const dpp::voice_server_update_t& ev);

    // PATCH /v4/sessions/{sessionId}. Needs a running cluster, so call from on_ready.
    void ensure_session();

    // Track lookup
    load_result load_tracks(const std::string& identifier) const;

    // Player controls
    // Replaces whatever the guild's player holds.
    bool play(dpp::snowflake guild_id, const std::string& encoded_track);

    bool stop(dpp::snowflake guild_id);
    bool pause(dpp::snowflake guild_id, bool pause_flag);

    // GET /v4/sessions/{sessionId}/players/{guildId}. nullopt if the request
    // failed; a player without a track if Lavalink has none for the guild.
    std::optional<player_state> get_player(dpp::snowflake guild_id) const;

    // Parses one element of a loadtracks "data" array (or a player's "track").
    static catalog::track parse_track(const json& el);

    // Parses a /v4/loadtracks body.
    static load_result parse_load_result(const std::string& body);

    // Parses a player object. nullopt if the body is not JSON.
    static std::optional<player_state> parse_player(const std::string& body);

private:
    struct voice_state {
        std::string session_id;      // Discord voice session id
        std::string token;
        std::string endpoint;
    };

    struct http_response {
        uint16_t    status = 0;
        std::string body;
    };

    dpp::cluster& m_cluster;
    node_config   m_cfg;

    // Lavalink v4 session id (used in /v4/sessions/{sessionId}/players/...)
    std::string   m_session_id;

    mutable std::mutex m_voice_mutex;
    std::unordered_map<dpp::snowflake, voice_state> m_voice_states;

    http_response http_request(const std::string& method,
                               const std::string& urlpath,
                               const std::string& body_json = "") const;

    std::optional<voice_state> get_voice_state_locked(dpp::snowflake guild_id) const;

    bool send_player_update(dpp::snowflake guild_id,
                            const std::string& body_json,
                            bool log_payload);
};

} // namespace dt::lavalink
