#include "dt/session/manager.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <optional>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

namespace dt::session {

class session_manager::guild_worker {
public:
    guild_worker(dpp::snowflake guild_id, collaborators deps, controller_options options, log_sink log)
        : m_guild_id(guild_id)
        , m_log(std::move(log))
        , m_controller(guild_id, bind_generation(std::move(deps)), options)
        , m_thread([this] { run(); })
    {
    }

    ~guild_worker() {
        stop();
    }

    void post(command cmd, bool supersedes) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping) {
                return;
            }
            if (supersedes) {
                m_generation.fetch_add(1);
            }
            m_commands.push_back(std::move(cmd));
        }
        m_cv.notify_one();
    }

    void stop() {
        std::size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping) {
                return;
            }
            m_stopping = true;
            dropped = m_commands.size();
            m_commands.clear();
            // Anything the worker is selecting right now is no longer wanted.
            m_generation.fetch_add(1);
        }
        m_cv.notify_one();

        if (m_thread.joinable()) {
            m_thread.join();
        }

        if (dropped > 0) {
            std::ostringstream oss;
            oss << "Dropped " << dropped << " pending command(s) for guild " << m_guild_id;
            m_log(dpp::ll_debug, oss.str());
        }
    }

    // Nothing queued or running, and the session is idle.
    bool idle() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_commands.empty() && !m_busy && m_session_idle;
    }

private:
    dpp::snowflake             m_guild_id;
    log_sink                   m_log;
    std::atomic<std::uint64_t> m_generation{0};
    session_controller         m_controller;

    mutable std::mutex      m_mutex;
    std::condition_variable m_cv;
    std::deque<command>     m_commands;
    bool                    m_stopping = false;
    bool                    m_busy = false;
    bool                    m_session_idle = true;

    // Commands left to run before an interrupted advance is resumed.
    // Worker thread only.
    std::optional<std::size_t> m_resume_countdown;

    std::thread m_thread;

    collaborators bind_generation(collaborators deps) {
        deps.generation = [this] { return m_generation.load(); };
        return deps;
    }

    void run() {
        for (;;) {
            command cmd;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_cv.wait(lock, [this] { return m_stopping || !m_commands.empty(); });
                if (m_stopping) {
                    return;
                }
                cmd = std::move(m_commands.front());
                m_commands.pop_front();
                m_busy = true;
            }

            try {
                cmd(m_controller);
                settle_interrupted();
            } catch (const std::exception& e) {
                std::ostringstream oss;
                oss << "Command for guild " << m_guild_id << " threw: " << e.what();
                m_log(dpp::ll_error, oss.str());
            }

            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
            m_session_idle = m_controller.current_mode() == mode::idle && !m_controller.interrupted();
        }
    }

    // A track-end advance discarded by a superseding command resumes once the
    // commands queued behind it have run, unless one of them ended the mode.
    void settle_interrupted() {
        if (!m_controller.interrupted()) {
            m_resume_countdown.reset();
            return;
        }
        if (!m_resume_countdown) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_resume_countdown = m_commands.size();
        } else if (*m_resume_countdown > 0) {
            --*m_resume_countdown;
        }
        if (*m_resume_countdown > 0) {
            return;
        }
        m_resume_countdown.reset();
        m_controller.resume_interrupted();
    }
};

session_manager::session_manager(catalog::catalog_client& catalog,
                                 playback::playback_driver& driver,
                                 log_sink log,
                                 notice_sink notices,
                                 controller_options options,
                                 std::function<session_clock::time_point()> now)
    : m_catalog(catalog)
    , m_driver(driver)
    , m_log(log ? std::move(log) : null_sink())
    , m_notices(std::move(notices))
    , m_options(options)
    , m_now(std::move(now))
{
}

session_manager::~session_manager() {
    shutdown();
}

void session_manager::post(dpp::snowflake guild_id, command cmd, bool supersedes) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stopped) {
        m_log(dpp::ll_debug, "Ignoring command for guild " + guild_id.str() + " during shutdown");
        return;
    }
    auto& slot = m_workers[guild_id];
    if (!slot) {
        collaborators deps{m_catalog, m_driver, m_log, m_notices, m_now, {}};
        slot = std::make_unique<guild_worker>(guild_id, std::move(deps), m_options, m_log);
        m_log(dpp::ll_debug, "Started session worker for guild " + guild_id.str());
    }
    slot->post(std::move(cmd), supersedes);
}

void session_manager::dispatch(const playback::playback_event& ev) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_workers.find(ev.guild_id);
    if (m_stopped || it == m_workers.end()) {
        m_log(dpp::ll_debug, "Dropping player event for guild " + ev.guild_id.str() + " without a session");
        return;
    }
    it->second->post([ev](session_controller& controller) { controller.on_playback_event(ev); }, false);
}

std::size_t session_manager::reap_idle() {
    std::vector<std::unique_ptr<guild_worker>> reaped;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_workers.begin(); it != m_workers.end();) {
            if (it->second->idle()) {
                reaped.push_back(std::move(it->second));
                it = m_workers.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& worker : reaped) {
        worker->stop();
    }

    if (!reaped.empty()) {
        std::ostringstream oss;
        oss << "Reaped " << reaped.size() << " idle session worker(s)";
        m_log(dpp::ll_debug, oss.str());
    }
    return reaped.size();
}

void session_manager::shutdown() {
    std::unordered_map<dpp::snowflake, std::unique_ptr<guild_worker>> workers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopped) {
            return;
        }
        m_stopped = true;
        workers.swap(m_workers);
    }

    for (auto& entry : workers) {
        entry.second->stop();
    }

    std::ostringstream oss;
    oss << "Stopped " << workers.size() << " session worker(s)";
    m_log(dpp::ll_info, oss.str());
}

std::size_t session_manager::guild_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_workers.size();
}

} // namespace dt::session
