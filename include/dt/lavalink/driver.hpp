#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "dt/lavalink/client.hpp"
#include "dt/logging.hpp"
#include "dt/playback/playback_driver.hpp"

namespace dt::lavalink {

// How far a started track got, as far as the player polls could tell.
struct playback_progress {
    std::int64_t duration_ms = 0;      // 0 for streams and unknown lengths
    std::int64_t last_position_ms = 0;
    bool         seen = false;         // the player reported the track at least once
};

/// Playback driver on top of a Lavalink node. Lavalink reports track ends on
/// its websocket; this driver instead polls the player REST endpoint, so
/// main() has to call poll() from a cluster timer.
class lavalink_driver : public playback::playback_driver {
public:
    lavalink_driver(node& lavalink, log_sink log, std::int64_t poll_interval_ms = 2000);

    bool start(dpp::snowflake guild_id, const catalog::track& t) override;
    bool pause(dpp::snowflake guild_id) override;
    bool resume(dpp::snowflake guild_id) override;
    bool halt(dpp::snowflake guild_id) override;

    void set_event_handler(playback::event_handler handler) override;

    /// Reports an event for every guild whose player no longer holds the
    /// track we started.
    void poll();

    /// A track that left the player close to its end finished; one that was
    /// never seen playing, or left well before its end, failed.
    static playback::event_kind classify_end(const playback_progress& progress, std::int64_t poll_interval_ms);

    // Slack for position updates lagging behind playback.
    static constexpr std::int64_t end_slack_ms = 5000;

private:
    struct active_track {
        std::string       id;
        playback_progress progress;
    };

    node&        m_node;
    log_sink     m_log;
    std::int64_t m_poll_interval_ms;

    std::mutex                                       m_mutex;
    std::unordered_map<dpp::snowflake, active_track> m_active;
    playback::event_handler                          m_handler;
};

} // namespace dt::lavalink
