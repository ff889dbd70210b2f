#pragma once

#include <dpp/dpp.h>

#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "dt/session/controller.hpp"
#include "dt/session/manager.hpp"
#include "dt/stations/preset_store.hpp"

namespace dt::commands {

/// Remembers the text channel each guild last used a music command in, so
/// session notices (the next radio track, autoplay ending) land there.
class notice_channels {
public:
    void remember(dpp::snowflake guild_id, dpp::snowflake channel_id);
    std::optional<dpp::snowflake> find(dpp::snowflake guild_id) const;

private:
    mutable std::mutex                                   m_mutex;
    std::unordered_map<dpp::snowflake, dpp::snowflake>   m_channels;
};

struct services {
    dpp::cluster&              bot;
    session::session_manager&  sessions;
    stations::preset_store&    stations;
    notice_channels&           channels;
};

/// Gateway op 4 voice state update. Lavalink plays the audio; Discord only
/// needs to know where the bot sits. No channel means leave.
dpp::json voice_state_payload(dpp::snowflake guild_id, std::optional<dpp::snowflake> channel_id);

/// Build the music slash commands (/play, /radio, /station, ...).
std::vector<dpp::slashcommand> make_commands(dpp::cluster& bot);

/// Dispatch a music slash command. Returns false if `ev` is not one of ours.
bool route_slashcommand(const dpp::slashcommand_t& ev, services& svc);

/// Post a session notice to the guild's notice channel, if it has one.
void announce(dpp::cluster& bot, const notice_channels& channels, const session::session_notice& notice);

} // namespace dt::commands
