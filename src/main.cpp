#include <dpp/dpp.h>                // D++

#include <cstdint>
#include <iomanip>                  // std::setprecision
#include <sstream>                  // std::ostringstream
#include <string>

#include "dt/commands/music.hpp"    // Music slash commands
#include "dt/config.hpp"            // Environment configuration
#include "dt/lavalink/catalog.hpp"  // Lavalink track search
#include "dt/lavalink/client.hpp"   // Lavalink connection
#include "dt/lavalink/driver.hpp"   // Lavalink playback
#include "dt/logging.hpp"
#include "dt/session/manager.hpp"   // Per-guild sessions
#include "dt/signals.hpp"           // SIGINT/SIGTERM
#include "dt/stations/preset_store.hpp"

using namespace dpp;

int main() {
    std::string warnings;
    const dt::bot_config cfg = dt::load_config_from_env(warnings);

    cluster bot(cfg.token);
    bot.on_log(utility::cout_logger()); // D++ logger

    if (!warnings.empty()) {
        std::istringstream lines(warnings);
        for (std::string line; std::getline(lines, line);) {
            bot.log(ll_warning, "Config: " + line);
        }
    }

    // ---------- Lavalink node ----------
    dt::lavalink::node lavalink(bot, cfg.lavalink);
    dt::lavalink::lavalink_catalog catalog(lavalink);
    dt::lavalink::lavalink_driver driver(lavalink, dt::cluster_sink(bot),
                                         static_cast<std::int64_t>(cfg.player_poll_seconds) * 1000);

    // ---------- Sessions ----------
    dt::stations::preset_store stations(cfg.stations_file, dt::cluster_sink(bot));
    dt::commands::notice_channels channels;

    dt::session::session_manager sessions(
        catalog, driver, dt::cluster_sink(bot),
        [&bot, &channels](const dt::session::session_notice& notice) {
            dt::commands::announce(bot, channels, notice);
        },
        cfg.session);

    driver.set_event_handler([&sessions](const dt::playback::playback_event& ev) {
        sessions.dispatch(ev);
    });

    dt::commands::services svc{bot, sessions, stations, channels};

    // ---------- Voice glue for Lavalink ----------
    bot.on_voice_state_update([&](const dpp::voice_state_update_t& ev) {
        lavalink.handle_voice_state_update(ev);
    });

    bot.on_voice_server_update([&](const dpp::voice_server_update_t& ev) {
        lavalink.handle_voice_server_update(ev);
    });

    // ---------- Slash command handler ----------
    bot.on_slashcommand([&bot, &svc](const slashcommand_t& event) {
        // Route music commands first
        if (dt::commands::route_slashcommand(event, svc)) {
            return;
        }

        // ---------- /ping ----------
        if (event.command.get_command_name() == "ping") {
            event.thinking(true);

            double gateway_ping_ms = 0.0;
            const auto& shards = bot.get_shards();
            if (!shards.empty()) {
                auto it = shards.begin();
                if (it->second) {
                    gateway_ping_ms = it->second->websocket_ping * 1000.0; // seconds -> ms
                }
            }

            double rest_ping_ms = bot.rest_ping * 1000.0;

            std::ostringstream out;
            out << "Pong!\n"
                << "Gateway: **" << std::fixed << std::setprecision(2)
                << gateway_ping_ms << " ms**\n"
                << "REST: **" << std::fixed << std::setprecision(2)
                << rest_ping_ms << " ms**";

            event.edit_original_response(dpp::message(out.str()));
        }
    });

    // ---------- on_ready ----------
    bot.on_ready([&bot, &lavalink, &driver, &sessions, &cfg](const ready_t& event) {
        (void)event;

        bot.log(ll_info, "Logged in as " + bot.me.username);

        if (run_once<struct lavalink_session>()) {
            lavalink.ensure_session();

            bot.start_timer([&driver, &sessions](timer t) {
                (void)t;
                driver.poll();
                sessions.reap_idle();
            }, cfg.player_poll_seconds);
        }

        // Slash commands
        if (run_once<struct register_bot_commands>()) {
            bot.log(ll_info, "Registering slash commands...");

            std::vector<slashcommand> all_cmds{
                slashcommand("ping", "Pong!", bot.me.id)
            };

            auto music_cmds = dt::commands::make_commands(bot);
            all_cmds.insert(all_cmds.end(), music_cmds.begin(), music_cmds.end());

            bot.global_bulk_command_create(all_cmds);
            bot.log(ll_info, "Registered slash commands!");
        }
    });

    dt::install_stop_handlers();

    bot.start_timer([&bot](timer t) {
        (void)t;
        if (dt::stop_requested()) {
            dt::clear_stop_request();
            bot.log(ll_info, "Signal received, shutting down");
            bot.shutdown();
        }
    }, 1);

    // ---------- Start bot ----------
    bot.start(dpp::st_wait);

    // Workers may still be waiting on Lavalink through the cluster.
    sessions.shutdown();
    return 0;
}
