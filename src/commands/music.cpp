#include "dt/commands/music.hpp"

#include <sstream>
#include <string>
#include <variant>

#include "dt/commands/format.hpp"
#include "dt/stations/station_ops.hpp"

namespace dt::commands {

using session::result;
using session::session_controller;

void notice_channels::remember(dpp::snowflake guild_id, dpp::snowflake channel_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_channels[guild_id] = channel_id;
}

std::optional<dpp::snowflake> notice_channels::find(dpp::snowflake guild_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_channels.find(guild_id);
    if (it == m_channels.end()) {
        return std::nullopt;
    }
    return it->second;
}

namespace {

void reply(const dpp::slashcommand_t& ev, const result& r) {
    std::string text = r.message;
    if (text.empty()) {
        text = r.ok() ? "Done" : session::to_string(r.code);
    }
    ev.edit_original_response(dpp::message(text));
}

std::string string_param(const dpp::slashcommand_t& ev, const std::string& name) {
    auto value = ev.get_parameter(name);
    if (std::holds_alternative<std::string>(value)) {
        return std::get<std::string>(value);
    }
    return {};
}

bool send_voice_state(dpp::cluster& bot, dpp::snowflake guild_id, std::optional<dpp::snowflake> channel_id) {
    const uint32_t shards   = bot.numshards == 0 ? 1 : bot.numshards;
    const uint32_t shard_id = static_cast<uint32_t>((static_cast<uint64_t>(guild_id) >> 22) % shards);
    dpp::discord_client* shard = bot.get_shard(shard_id);
    if (shard == nullptr) {
        return false;
    }
    shard->queue_message(voice_state_payload(guild_id, channel_id).dump());
    return true;
}

bool join_caller_voice(dpp::cluster& bot, const dpp::slashcommand_t& ev) {
    dpp::guild* g = dpp::find_guild(ev.command.guild_id);
    if (g == nullptr) {
        return false;
    }

    auto it = g->voice_members.find(ev.command.get_issuing_user().id);
    if (it == g->voice_members.end() || it->second.channel_id.empty()) {
        return false;
    }
    return send_voice_state(bot, ev.command.guild_id, it->second.channel_id);
}

bool bot_in_voice(dpp::cluster& bot, dpp::snowflake guild_id) {
    dpp::guild* g = dpp::find_guild(guild_id);
    if (g == nullptr) {
        return false;
    }
    auto it = g->voice_members.find(bot.me.id);
    return it != g->voice_members.end() && !it->second.channel_id.empty();
}

// Runs `fn` on the guild's session worker and edits the deferred reply with
// whatever it returns.
template <typename Fn>
void on_session(services& svc, const dpp::slashcommand_t& ev, bool supersedes, Fn fn) {
    svc.sessions.post(ev.command.guild_id,
        [ev, fn](session_controller& session) {
            reply(ev, fn(session));
        },
        supersedes);
}

} // namespace

dpp::json voice_state_payload(dpp::snowflake guild_id, std::optional<dpp::snowflake> channel_id) {
    dpp::json payload;
    payload["op"] = 4;
    payload["d"]["guild_id"] = guild_id.str();
    if (channel_id) {
        payload["d"]["channel_id"] = channel_id->str();
    } else {
        payload["d"]["channel_id"] = nullptr;
    }
    payload["d"]["self_mute"] = false;
    payload["d"]["self_deaf"] = true;
    return payload;
}

std::vector<dpp::slashcommand> make_commands(dpp::cluster& bot) {
    const auto app_id = bot.me.id;

    dpp::slashcommand play("play", "Queue a song by search text or URL", app_id);
    play.add_option(dpp::command_option(dpp::co_string, "query", "Search text or URL", true));

    dpp::slashcommand skip("skip", "Skip the current track", app_id);
    dpp::slashcommand stop("stop", "Stop playback and clear the queue", app_id);
    dpp::slashcommand clear("clear", "Clear the queue and stop playback", app_id);
    dpp::slashcommand pause("pause", "Pause playback", app_id);
    dpp::slashcommand resume("resume", "Resume playback", app_id);
    dpp::slashcommand queue("queue", "Show the queue", app_id);
    dpp::slashcommand np("np", "Show the current track", app_id);
    dpp::slashcommand leave("leave", "Stop playback and leave the voice channel", app_id);

    dpp::slashcommand autoplay("autoplay", "Play songs by an artist for two hours", app_id);
    autoplay.add_option(dpp::command_option(dpp::co_string, "artist", "Artist name", true));
    dpp::slashcommand stopautoplay("stopautoplay", "Stop autoplay", app_id);
    dpp::slashcommand autoplaystatus("autoplaystatus", "Show autoplay progress", app_id);

    dpp::slashcommand radio("radio", "Start a radio from a description", app_id);
    radio.add_option(dpp::command_option(dpp::co_string, "description", "e.g. chill lo-fi beats", true));

    dpp::slashcommand tune("tune", "Steer the radio in a new direction", app_id);
    tune.add_option(dpp::command_option(dpp::co_string, "direction", "e.g. more jazzy", true));

    dpp::slashcommand dial("dial", "Turn the radio energy up or down", app_id);
    dial.add_option(
        dpp::command_option(dpp::co_string, "direction", "Which way to turn the dial", true)
            .add_choice(dpp::command_option_choice("Up", std::string("up")))
            .add_choice(dpp::command_option_choice("Down", std::string("down")))
    );

    dpp::slashcommand static_cmd("static", "Skip this track and steer away from it", app_id);
    dpp::slashcommand signal("signal", "Show what the radio is tuned to", app_id);
    dpp::slashcommand stopradio("stopradio", "Stop the radio", app_id);

    dpp::slashcommand station("station", "Save, load or delete a radio station", app_id);
    station.add_option(
        dpp::command_option(dpp::co_string, "action", "What to do", true)
            .add_choice(dpp::command_option_choice("Save", std::string("save")))
            .add_choice(dpp::command_option_choice("Load", std::string("load")))
            .add_choice(dpp::command_option_choice("Delete", std::string("delete")))
    );
    station.add_option(dpp::command_option(dpp::co_string, "name", "Station name", true));

    dpp::slashcommand stations("stations", "List saved stations", app_id);

    return {
        play, skip, stop, clear, pause, resume, queue, np, leave,
        autoplay, stopautoplay, autoplaystatus,
        radio, tune, dial, static_cmd, signal, stopradio,
        station, stations
    };
}

bool route_slashcommand(const dpp::slashcommand_t& ev, services& svc) {
    const std::string name = ev.command.get_command_name();
    const dpp::snowflake guild_id = ev.command.guild_id;

    static const char* const known[] = {
        "play", "skip", "stop", "clear", "pause", "resume", "queue", "np", "leave",
        "autoplay", "stopautoplay", "autoplaystatus",
        "radio", "tune", "dial", "static", "signal", "stopradio",
        "station", "stations"
    };
    bool ours = false;
    for (const char* k : known) {
        if (name == k) {
            ours = true;
            break;
        }
    }
    if (!ours) {
        return false;
    }

    if (guild_id.empty()) {
        ev.reply(dpp::message("Music commands only work in a server.").set_flags(dpp::m_ephemeral));
        return true;
    }

    ev.thinking(false);
    svc.channels.remember(guild_id, ev.command.channel_id);

    // ---------- manual queue ----------
    if (name == "play") {
        const std::string query = string_param(ev, "query");
        if (!join_caller_voice(svc.bot, ev)) {
            ev.edit_original_response(dpp::message("Join a voice channel first."));
            return true;
        }
        on_session(svc, ev, false, [query](session_controller& s) { return s.play(query); });
    } else if (name == "skip") {
        on_session(svc, ev, false, [](session_controller& s) { return s.skip(); });
    } else if (name == "stop") {
        on_session(svc, ev, true, [](session_controller& s) { return s.stop(); });
    } else if (name == "clear") {
        on_session(svc, ev, true, [](session_controller& s) { return s.clear(); });
    } else if (name == "pause") {
        on_session(svc, ev, false, [](session_controller& s) { return s.pause(); });
    } else if (name == "resume") {
        on_session(svc, ev, false, [](session_controller& s) { return s.resume(); });
    } else if (name == "queue") {
        on_session(svc, ev, false, [](session_controller& s) {
            return result::success(format_queue(s.view_queue(queue_view_limit)));
        });
    } else if (name == "np") {
        on_session(svc, ev, false, [](session_controller& s) {
            const auto& current = s.current_track();
            if (!current) {
                return result::failure(session::errc::not_playing, "Nothing is playing");
            }
            std::ostringstream oss;
            oss << "**Now playing:** " << current->title
                << " [" << format_duration(current->duration_ms) << "]";
            if (s.paused()) {
                oss << " (paused)";
            }
            return result::success(oss.str());
        });
    } else if (name == "leave") {
        if (!bot_in_voice(svc.bot, guild_id)) {
            ev.edit_original_response(dpp::message("I'm not in a voice channel!"));
            return true;
        }
        if (!send_voice_state(svc.bot, guild_id, std::nullopt)) {
            ev.edit_original_response(dpp::message("Could not reach the gateway, try again."));
            return true;
        }
        on_session(svc, ev, true, [](session_controller& s) {
            auto stopped = s.stop();
            return stopped ? result::success("Left the voice channel") : stopped;
        });
    }

    // ---------- autoplay ----------
    else if (name == "autoplay") {
        const std::string artist = string_param(ev, "artist");
        if (!join_caller_voice(svc.bot, ev)) {
            ev.edit_original_response(dpp::message("Join a voice channel first."));
            return true;
        }
        on_session(svc, ev, false, [artist](session_controller& s) { return s.start_autoplay(artist); });
    } else if (name == "stopautoplay") {
        on_session(svc, ev, true, [](session_controller& s) { return s.stop_autoplay(); });
    } else if (name == "autoplaystatus") {
        on_session(svc, ev, false, [](session_controller& s) {
            auto report = s.autoplay_status();
            if (!report) {
                return result::failure(session::errc::not_in_autoplay, "Autoplay is not running.");
            }
            return result::success(format_autoplay_status(*report));
        });
    }

    // ---------- radio ----------
    else if (name == "radio") {
        const std::string description = string_param(ev, "description");
        if (!join_caller_voice(svc.bot, ev)) {
            ev.edit_original_response(dpp::message("Join a voice channel first."));
            return true;
        }
        on_session(svc, ev, false, [description](session_controller& s) { return s.start_radio(description); });
    } else if (name == "tune") {
        const std::string direction = string_param(ev, "direction");
        on_session(svc, ev, false, [direction](session_controller& s) { return s.tune(direction); });
    } else if (name == "dial") {
        const int delta = string_param(ev, "direction") == "down" ? -1 : 1;
        on_session(svc, ev, false, [delta](session_controller& s) { return s.dial(delta); });
    } else if (name == "static") {
        on_session(svc, ev, false, [](session_controller& s) { return s.apply_static(); });
    } else if (name == "signal") {
        on_session(svc, ev, false, [](session_controller& s) {
            auto report = s.signal();
            if (!report) {
                return result::failure(session::errc::not_in_radio, "Radio is not running. Start with /radio <description>");
            }
            return result::success(format_signal(*report));
        });
    } else if (name == "stopradio") {
        on_session(svc, ev, true, [](session_controller& s) { return s.stop_radio(); });
    }

    // ---------- stations ----------
    else if (name == "station") {
        const std::string action = string_param(ev, "action");
        const std::string station_name = string_param(ev, "name");
        stations::preset_store& store = svc.stations;

        if (action == "save") {
            on_session(svc, ev, false, [&store, guild_id, station_name](session_controller& s) {
                return stations::save_station(s, store, guild_id, station_name);
            });
        } else if (action == "load") {
            if (!join_caller_voice(svc.bot, ev)) {
                ev.edit_original_response(dpp::message("Join a voice channel first."));
                return true;
            }
            on_session(svc, ev, false, [&store, guild_id, station_name](session_controller& s) {
                return stations::load_station(s, store, guild_id, station_name);
            });
        } else if (action == "delete") {
            on_session(svc, ev, false, [&store, guild_id, station_name](session_controller&) {
                return stations::delete_station(store, guild_id, station_name);
            });
        } else {
            ev.edit_original_response(dpp::message("Invalid action!"));
        }
    } else if (name == "stations") {
        ev.edit_original_response(dpp::message(format_stations(svc.stations.entries(guild_id))));
    }

    return true;
}

void announce(dpp::cluster& bot, const notice_channels& channels, const session::session_notice& notice) {
    auto channel = channels.find(notice.guild_id);
    if (!channel) {
        return;
    }
    const std::string text = format_notice(notice);
    if (text.empty()) {
        return;
    }
    bot.message_create(dpp::message(*channel, text));
}

} // namespace dt::commands
