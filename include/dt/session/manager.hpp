#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <dpp/snowflake.h>

#include "dt/catalog/catalog_client.hpp"
#include "dt/logging.hpp"
#include "dt/playback/playback_driver.hpp"
#include "dt/session/controller.hpp"

namespace dt::session {

/// Owns one session_controller per guild, each behind its own worker thread.
/// Everything for a guild (slash commands and driver events alike) runs on
/// that worker in the order it was posted; different guilds run in parallel.
class session_manager {
public:
    using command = std::function<void(session_controller&)>;

    session_manager(catalog::catalog_client& catalog,
                    playback::playback_driver& driver,
                    log_sink log,
                    notice_sink notices,
                    controller_options options = {},
                    std::function<session_clock::time_point()> now = {});
    ~session_manager();

    session_manager(const session_manager&) = delete;
    session_manager& operator=(const session_manager&) = delete;

    /// Queue a command for the guild, starting its worker if needed.
    /// Pass supersedes = true for commands that end a mode: a selection the
    /// worker is waiting on right now is then discarded when it returns.
    void post(dpp::snowflake guild_id, command cmd, bool supersedes = false);

    /// Route a driver event through the guild's worker. Events for guilds
    /// without a session are dropped.
    void dispatch(const playback::playback_event& ev);

    /// Stop and forget the workers of idle guilds with nothing queued. A later
    /// command for such a guild starts a fresh worker. Returns how many went.
    std::size_t reap_idle();

    /// Stop all workers. Commands still queued are dropped.
    void shutdown();

    std::size_t guild_count() const;

private:
    class guild_worker;

    catalog::catalog_client&                   m_catalog;
    playback::playback_driver&                 m_driver;
    log_sink                                   m_log;
    notice_sink                                m_notices;
    controller_options                         m_options;
    std::function<session_clock::time_point()> m_now;

    mutable std::mutex                                                m_mutex;
    std::unordered_map<dpp::snowflake, std::unique_ptr<guild_worker>> m_workers;
    bool                                                              m_stopped = false;
};

} // namespace dt::session
