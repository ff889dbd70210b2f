#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <dpp/snowflake.h>

#include "dt/catalog/catalog_client.hpp"
#include "dt/logging.hpp"
#include "dt/playback/playback_driver.hpp"
#include "dt/session/errors.hpp"
#include "dt/session/play_history.hpp"
#include "dt/session/track_queue.hpp"
#include "dt/session/tuning.hpp"

namespace dt::session {

enum class mode {
    idle,
    manual,
    autoplay,
    radio
};

const char* to_string(mode m);

using session_clock = std::chrono::system_clock;

struct autoplay_state {
    std::string               artist;
    session_clock::time_point deadline;
    std::size_t               elapsed_songs = 0;
};

struct signal_report {
    std::string description;
    int         energy = 0;
    std::size_t elapsed_tracks = 0;
    std::size_t direction_count = 0;
    std::chrono::minutes remaining{0};
};

struct autoplay_report {
    std::string          artist;
    std::size_t          elapsed_songs = 0;
    std::chrono::minutes remaining{0};
};

struct queue_view {
    std::optional<catalog::track> now_playing;
    std::vector<catalog::track>   up_next;
    std::size_t                   total = 0;
};

enum class notice_kind {
    now_playing,
    session_ended,
    selection_failed,
    playback_failed
};

/// Something the guild should be told about that no command is waiting on,
/// e.g. the next radio track starting after the previous one finished.
struct session_notice {
    dpp::snowflake                guild_id;
    notice_kind                   kind = notice_kind::now_playing;
    std::string                   text;
    std::optional<catalog::track> track;
};

using notice_sink = std::function<void(const session_notice&)>;

struct controller_options {
    std::chrono::seconds autoplay_window = std::chrono::hours(2);
    std::chrono::seconds radio_window = std::chrono::hours(2);
    int                  playback_retry_cap = 3;
};

struct collaborators {
    catalog::catalog_client&                   catalog;
    playback::playback_driver&                 driver;
    log_sink                                   log;
    notice_sink                                notify;
    std::function<session_clock::time_point()> now;        // defaults to session_clock::now
    std::function<std::uint64_t()>             generation; // bumped by mode changes posted behind us
};

/// Playback session of one guild: idle, a manual queue, a timed artist
/// autoplay or a tunable radio, never more than one at a time.
///
/// Not thread safe. The session_manager runs every call for a guild on that
/// guild's worker; collaborator calls (catalog, driver) block that worker.
/// Every operation either commits all of its changes or none of them.
class session_controller {
public:
    session_controller(dpp::snowflake guild_id, collaborators deps, controller_options options = {});

    // Manual queue
    result play(const std::string& query);
    result skip();
    result stop();
    result clear();
    result pause();
    result resume();

    // Autoplay
    result start_autoplay(const std::string& artist);
    result stop_autoplay();

    // Radio
    result start_radio(const std::string& description);
    result load_station(const tuning& snapshot);
    result tune(const std::string& direction);
    result dial(int delta);
    result apply_static();
    result stop_radio();

    // Driver events
    void on_playback_event(const playback::playback_event& ev);
    void on_track_finished(const std::string& track_id);
    void on_track_error(const std::string& track_id, const std::string& cause);

    /// Re-runs a track-end advance that a superseding command interrupted,
    /// if that command left the mode running. The session_manager calls this
    /// once the guild has no commands left to run.
    void resume_interrupted();
    bool interrupted() const { return m_advance_interrupted; }

    // Read-only views
    mode current_mode() const { return m_mode; }
    const std::optional<catalog::track>& current_track() const { return m_current; }
    bool paused() const { return m_paused; }
    const play_history& history() const { return m_history; }
    std::size_t queued() const { return m_queue.size(); }

    queue_view view_queue(std::size_t limit) const;
    std::optional<signal_report> signal() const;
    std::optional<autoplay_report> autoplay_status() const;
    std::optional<tuning> tuning_snapshot() const { return m_tuning; }

private:
    struct selection {
        result                        outcome;
        std::optional<catalog::track> started;
    };

    dpp::snowflake     m_guild_id;
    collaborators      m_deps;
    controller_options m_options;

    mode                          m_mode = mode::idle;
    std::optional<catalog::track> m_current;
    bool                          m_paused = false;
    track_queue                   m_queue;
    play_history                  m_history;
    std::optional<tuning>         m_tuning;
    std::optional<autoplay_state> m_autoplay;
    std::size_t                   m_radio_tracks = 0;
    session_clock::time_point     m_radio_deadline{};
    int                           m_error_streak = 0;
    bool                          m_seed_stale = false; // tuning changed since the current track started

    std::optional<mode> m_abandoned_entry;             // a mode start discarded by a stop posted behind it
    bool                m_advance_interrupted = false; // the current track ended but no successor was started

    std::uint64_t issue() const;
    bool stale(std::uint64_t issued) const;

    catalog::steering radio_steering(const tuning& t, const std::set<std::string>& avoid) const;
    catalog::steering artist_steering(const std::string& artist) const;

    std::optional<catalog::track> pick(const std::vector<catalog::track>& candidates,
                                       const play_history& history,
                                       const std::set<std::string>& avoid) const;

    // Recommend, pick, start. Widens once when every candidate is a duplicate.
    selection select_and_start(const catalog::steering& request, play_history& history,
                               std::uint64_t issued);

    // Dequeue and start, skipping tracks the driver refuses.
    selection start_from_queue(track_queue& queue, play_history& history);

    result advance_autoplay(std::uint64_t issued);
    result advance_radio(const std::set<std::string>& avoid, std::uint64_t issued);
    result enter_radio(tuning initial, const std::string& verb);
    void advance_after_end();
    std::optional<result> stopped_before_start(mode wanted);

    void commit_now_playing(const catalog::track& t);
    void halt_driver();
    void reset_to_idle();
    void end_session(notice_kind kind, const std::string& text);
    void notify(notice_kind kind, const std::string& text,
                std::optional<catalog::track> t = std::nullopt) const;
    void log(dpp::loglevel level, const std::string& message) const;
};

} // namespace dt::session
