#include "dt/lavalink/driver.hpp"

#include <sstream>
#include <utility>
#include <vector>

namespace dt::lavalink {

lavalink_driver::lavalink_driver(node& lavalink, log_sink log, std::int64_t poll_interval_ms)
    : m_node(lavalink)
    , m_log(log ? std::move(log) : null_sink())
    , m_poll_interval_ms(poll_interval_ms)
{
}

bool lavalink_driver::start(dpp::snowflake guild_id, const catalog::track& t) {
    if (t.encoded.empty()) {
        m_log(dpp::ll_warning, "Refusing to start track " + t.id + " without an encoded handle");
        return false;
    }
    if (!m_node.play(guild_id, t.encoded)) {
        return false;
    }

    active_track entry;
    entry.id = t.id;
    entry.progress.duration_ms = t.is_stream ? 0 : t.duration_ms;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_active[guild_id] = std::move(entry);
    return true;
}

bool lavalink_driver::pause(dpp::snowflake guild_id) {
    return m_node.pause(guild_id, true);
}

bool lavalink_driver::resume(dpp::snowflake guild_id) {
    return m_node.pause(guild_id, false);
}

bool lavalink_driver::halt(dpp::snowflake guild_id) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_active.erase(guild_id);
    }
    return m_node.stop(guild_id);
}

void lavalink_driver::set_event_handler(playback::event_handler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handler = std::move(handler);
}

playback::event_kind lavalink_driver::classify_end(const playback_progress& progress, std::int64_t poll_interval_ms) {
    if (!progress.seen) {
        return playback::event_kind::error;
    }
    if (progress.duration_ms <= 0) {
        return playback::event_kind::finished;
    }
    // Between two polls the track may have played one more interval unseen.
    const std::int64_t reached = progress.last_position_ms + 2 * poll_interval_ms + end_slack_ms;
    return reached >= progress.duration_ms ? playback::event_kind::finished : playback::event_kind::error;
}

void lavalink_driver::poll() {
    std::vector<std::pair<dpp::snowflake, std::string>> active;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [guild_id, entry] : m_active) {
            active.emplace_back(guild_id, entry.id);
        }
    }

    for (const auto& [guild_id, track_id] : active) {
        auto player = m_node.get_player(guild_id);
        if (!player) {
            continue; // Lavalink unreachable, try again next tick
        }

        const bool still_playing = player->track && player->track->id == track_id;

        playback::event_handler handler;
        playback_progress       progress;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_active.find(guild_id);
            if (it == m_active.end() || it->second.id != track_id) {
                continue; // restarted or halted while we were asking
            }
            if (still_playing) {
                it->second.progress.seen = true;
                it->second.progress.last_position_ms = player->position_ms;
                continue;
            }
            progress = it->second.progress;
            m_active.erase(it);
            handler = m_handler;
        }

        playback::playback_event ev;
        ev.guild_id = guild_id;
        ev.kind     = classify_end(progress, m_poll_interval_ms);
        ev.track_id = track_id;

        std::ostringstream oss;
        if (ev.kind == playback::event_kind::finished) {
            oss << "Track " << track_id << " ended for guild " << guild_id;
            m_log(dpp::ll_debug, oss.str());
        } else {
            if (progress.seen) {
                oss << "stopped at " << progress.last_position_ms / 1000 << "s of "
                    << progress.duration_ms / 1000 << "s";
            } else {
                oss << "never started playing";
            }
            ev.cause = oss.str();
            m_log(dpp::ll_warning, "Track " + track_id + " for guild " + guild_id.str() + " " + ev.cause);
        }

        if (handler) {
            handler(ev);
        }
    }
}

} // namespace dt::lavalink
