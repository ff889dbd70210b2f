#include "dt/session/controller.hpp"

#include "dt/session/track_filter.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace dt::session {

const char* to_string(mode m) {
    switch (m) {
    case mode::idle:     return "idle";
    case mode::manual:   return "manual";
    case mode::autoplay: return "autoplay";
    case mode::radio:    return "radio";
    }
    return "unknown";
}

namespace {

std::string bold(const std::string& s) {
    return "**" + s + "**";
}

std::string busy_message(mode m) {
    switch (m) {
    case mode::manual:   return "The queue is playing. Use /stop first.";
    case mode::autoplay: return "Autoplay is running. Use /stopautoplay first.";
    case mode::radio:    return "Radio is running. Use /stopradio first.";
    case mode::idle:     break;
    }
    return "Something else is playing.";
}

} // namespace

session_controller::session_controller(dpp::snowflake guild_id, collaborators deps, controller_options options)
    : m_guild_id(guild_id)
    , m_deps(std::move(deps))
    , m_options(options)
{
    if (!m_deps.now) {
        m_deps.now = [] { return session_clock::now(); };
    }
    if (!m_deps.log) {
        m_deps.log = null_sink();
    }
    if (m_options.playback_retry_cap < 1) {
        m_options.playback_retry_cap = 1;
    }
}

// ---------- Manual queue ----------

result session_controller::play(const std::string& query) {
    if (m_mode == mode::autoplay || m_mode == mode::radio) {
        return result::failure(errc::mode_conflict, busy_message(m_mode));
    }

    const auto issued = issue();
    auto found = m_deps.catalog.search(query);
    if (stale(issued)) {
        log(dpp::ll_debug, "Discarding search result for '" + query + "': session changed meanwhile");
        return result::failure(errc::superseded, "Playback was stopped before the search finished.");
    }
    if (found.status == catalog::catalog_status::unavailable) {
        return result::failure(errc::catalog_unavailable, "Could not reach the catalog: " + found.error_message);
    }
    if (found.tracks.empty()) {
        return result::failure(errc::not_found, "No results for `" + query + "`");
    }

    track_queue staged = m_queue;
    for (const auto& t : found.tracks) {
        staged.enqueue(t);
    }

    if (m_current) {
        m_queue = std::move(staged);
        m_mode  = mode::manual;

        std::ostringstream oss;
        if (found.tracks.size() == 1) {
            oss << "Added to queue: " << bold(found.tracks.front().title)
                << " (position " << m_queue.size() << ")";
        } else {
            oss << "Added " << found.tracks.size() << " tracks to the queue";
        }
        return result::success(oss.str());
    }

    play_history history = m_history;
    auto sel = start_from_queue(staged, history);
    if (!sel.outcome) {
        halt_driver();
        reset_to_idle();
        return sel.outcome;
    }

    m_queue   = std::move(staged);
    m_history = std::move(history);
    m_mode    = mode::manual;
    commit_now_playing(*sel.started);

    std::ostringstream oss;
    oss << "Playing " << bold(sel.started->title);
    if (found.tracks.size() > 1) {
        oss << " (+" << (found.tracks.size() - 1) << " queued)";
    }
    return result::success(oss.str());
}

result session_controller::skip() {
    switch (m_mode) {
    case mode::idle:
        return result::failure(errc::not_playing, "Nothing is playing");

    case mode::manual: {
        if (m_queue.empty()) {
            halt_driver();
            reset_to_idle();
            return result::failure(errc::empty_queue, "Queue is empty, playback stopped");
        }
        track_queue  queue   = m_queue;
        play_history history = m_history;
        auto sel = start_from_queue(queue, history);
        if (!sel.outcome) {
            halt_driver();
            reset_to_idle();
            return sel.outcome;
        }
        m_queue   = std::move(queue);
        m_history = std::move(history);
        commit_now_playing(*sel.started);
        return result::success("Skipped");
    }

    case mode::autoplay: {
        auto r = advance_autoplay(issue());
        return r ? result::success("Skipped") : r;
    }

    case mode::radio: {
        auto r = advance_radio({}, issue());
        return r ? result::success("Skipped") : r;
    }
    }
    return result::failure(errc::not_playing, "Nothing is playing");
}

result session_controller::stop() {
    halt_driver();
    reset_to_idle();
    log(dpp::ll_info, "Stopped");
    return result::success("Stopped and cleared queue");
}

result session_controller::clear() {
    halt_driver();
    reset_to_idle();
    log(dpp::ll_info, "Cleared");
    return result::success("Queue cleared and playback stopped");
}

result session_controller::pause() {
    if (!m_current) {
        return result::failure(errc::not_playing, "Nothing is playing");
    }
    if (!m_deps.driver.pause(m_guild_id)) {
        return result::failure(errc::playback_failure, "The player did not accept pause");
    }
    m_paused = true;
    return result::success("Paused");
}

result session_controller::resume() {
    if (!m_current) {
        return result::failure(errc::not_playing, "Nothing is playing");
    }
    if (!m_deps.driver.resume(m_guild_id)) {
        return result::failure(errc::playback_failure, "The player did not accept resume");
    }
    m_paused = false;
    return result::success("Resumed");
}

// ---------- Autoplay ----------

result session_controller::start_autoplay(const std::string& artist) {
    if (m_mode != mode::idle) {
        return result::failure(errc::mode_conflict, busy_message(m_mode));
    }

    const auto issued = issue();
    const auto now    = m_deps.now();

    autoplay_state state;
    state.artist   = artist;
    state.deadline = now + m_options.autoplay_window;
    state.elapsed_songs = 1;

    play_history history;
    auto sel = select_and_start(artist_steering(artist), history, issued);
    if (!sel.outcome) {
        if (sel.outcome.code == errc::superseded) {
            m_abandoned_entry = mode::autoplay;
        }
        return sel.outcome;
    }

    m_abandoned_entry.reset();
    m_mode     = mode::autoplay;
    m_history  = std::move(history);
    m_autoplay = std::move(state);
    m_queue.clear();
    commit_now_playing(*sel.started);

    log(dpp::ll_info, "Autoplay started for artist '" + artist + "'");

    const auto hours = std::chrono::duration_cast<std::chrono::hours>(m_options.autoplay_window).count();
    std::ostringstream oss;
    oss << "Starting autoplay for " << bold(artist) << " (" << hours << " hours, no duplicates)";
    return result::success(oss.str());
}

result session_controller::stop_autoplay() {
    if (m_mode != mode::autoplay) {
        if (auto early = stopped_before_start(mode::autoplay)) {
            return *early;
        }
        return result::failure(errc::not_in_autoplay, "Autoplay is not running.");
    }
    const auto played = m_autoplay->elapsed_songs;
    halt_driver();
    reset_to_idle();

    std::ostringstream oss;
    oss << "Autoplay stopped. Played " << played << " unique songs.";
    log(dpp::ll_info, oss.str());
    return result::success(oss.str());
}

// ---------- Radio ----------

result session_controller::start_radio(const std::string& description) {
    return enter_radio(tuning::fresh(description), "Tuning radio to ");
}

result session_controller::load_station(const tuning& snapshot) {
    tuning initial = snapshot;
    if (initial.directions.empty()) {
        initial.directions.push_back(initial.description);
    }
    return enter_radio(std::move(initial), "Loading station: ");
}

result session_controller::enter_radio(tuning initial, const std::string& verb) {
    if (m_mode != mode::idle) {
        return result::failure(errc::mode_conflict, busy_message(m_mode));
    }

    const auto issued = issue();
    play_history history;
    auto sel = select_and_start(radio_steering(initial, {}), history, issued);
    if (!sel.outcome) {
        if (sel.outcome.code == errc::superseded) {
            m_abandoned_entry = mode::radio;
        }
        return sel.outcome;
    }

    m_abandoned_entry.reset();
    m_mode           = mode::radio;
    m_history        = std::move(history);
    m_tuning         = std::move(initial);
    m_radio_tracks   = 1;
    m_radio_deadline = m_deps.now() + m_options.radio_window;
    m_queue.clear();
    commit_now_playing(*sel.started);

    std::ostringstream oss;
    oss << "Radio on: '" << m_tuning->description << "' energy=" << m_tuning->energy
        << " directions=" << m_tuning->directions.size();
    log(dpp::ll_info, oss.str());

    return result::success(verb + bold(m_tuning->description));
}

result session_controller::tune(const std::string& direction) {
    if (m_mode != mode::radio) {
        return result::failure(errc::not_in_radio, "Radio is not running. Start with /radio <description>");
    }
    if (m_current) {
        m_tuning->tune(direction);
        m_seed_stale = true;

        log(dpp::ll_debug, "Tuned radio to '" + direction + "'");
        return result::success("Retuned to " + bold(direction) + ". The next track follows the new direction.");
    }

    // The radio went quiet after running out of tracks; a new direction restarts it.
    const tuning previous = *m_tuning;
    m_tuning->tune(direction);
    auto r = advance_radio({}, issue());
    if (!r) {
        if (m_mode == mode::radio) {
            m_tuning = previous;
        }
        return r;
    }
    return result::success("Retuned to " + bold(direction) + ". Now playing " + bold(m_current->title));
}

result session_controller::dial(int delta) {
    if (m_mode != mode::radio) {
        return result::failure(errc::not_in_radio, "Radio is not running. Start with /radio <description>");
    }
    const int before = m_tuning->energy;
    const int after  = m_tuning->dial(delta);
    if (after != before) {
        m_seed_stale = true;
    }

    std::ostringstream oss;
    oss << "Dial adjusted: energy " << std::showpos << after;
    if (after == before) {
        oss << " (already at the limit)";
    }
    return result::success(oss.str());
}

result session_controller::apply_static() {
    if (m_mode != mode::radio) {
        return result::failure(errc::not_in_radio, "Radio is not running. Start with /radio <description>");
    }
    if (!m_current) {
        return result::failure(errc::not_playing, "Nothing is playing");
    }

    const std::string skipped = m_current->title;
    const std::set<std::string> avoid{m_current->id};
    auto r = advance_radio(avoid, issue());
    if (!r) {
        return r;
    }
    return result::success("Static! Skipped " + bold(skipped) + " and steering away from it.");
}

result session_controller::stop_radio() {
    if (m_mode != mode::radio) {
        if (auto early = stopped_before_start(mode::radio)) {
            return *early;
        }
        return result::failure(errc::not_in_radio, "Radio is not running.");
    }
    const auto played = m_radio_tracks;
    halt_driver();
    reset_to_idle();

    std::ostringstream oss;
    oss << "Radio stopped. Played " << played << " tracks.";
    log(dpp::ll_info, oss.str());
    return result::success(oss.str());
}

// ---------- Driver events ----------

void session_controller::on_playback_event(const playback::playback_event& ev) {
    switch (ev.kind) {
    case playback::event_kind::finished:
        on_track_finished(ev.track_id);
        break;
    case playback::event_kind::error:
        on_track_error(ev.track_id, ev.cause);
        break;
    }
}

void session_controller::on_track_finished(const std::string& track_id) {
    if (!m_current || m_current->id != track_id) {
        log(dpp::ll_debug, "Ignoring finished event for stale track " + track_id);
        return;
    }
    m_error_streak = 0;
    advance_after_end();
}

void session_controller::on_track_error(const std::string& track_id, const std::string& cause) {
    if (!m_current || m_current->id != track_id) {
        log(dpp::ll_debug, "Ignoring error event for stale track " + track_id);
        return;
    }

    ++m_error_streak;
    std::ostringstream oss;
    oss << "Track " << track_id << " failed (" << m_error_streak << "/"
        << m_options.playback_retry_cap << "): " << cause;
    log(dpp::ll_warning, oss.str());

    if (m_error_streak >= m_options.playback_retry_cap) {
        end_session(notice_kind::playback_failed,
                    "Playback kept failing (" + cause + "). Stopping.");
        return;
    }
    advance_after_end();
}

void session_controller::resume_interrupted() {
    if (!m_advance_interrupted) {
        return;
    }
    m_advance_interrupted = false;
    if (m_mode != mode::autoplay && m_mode != mode::radio) {
        return;
    }
    log(dpp::ll_debug, "Resuming the advance a superseding command interrupted");
    advance_after_end();
}

std::optional<result> session_controller::stopped_before_start(mode wanted) {
    if (m_mode != mode::idle || !m_abandoned_entry) {
        return std::nullopt;
    }
    const mode abandoned = *m_abandoned_entry;
    m_abandoned_entry.reset();

    std::ostringstream oss;
    if (abandoned == wanted) {
        oss << (wanted == mode::radio ? "Radio" : "Autoplay") << " stopped before the first track started.";
    } else {
        oss << "Cancelled starting " << to_string(abandoned) << ".";
    }
    log(dpp::ll_info, oss.str());
    return result::success(oss.str());
}

void session_controller::advance_after_end() {
    const auto issued = issue();

    switch (m_mode) {
    case mode::idle:
        m_current.reset();
        return;

    case mode::manual: {
        if (m_queue.empty()) {
            reset_to_idle();
            notify(notice_kind::session_ended, "Queue finished");
            return;
        }
        track_queue  queue   = m_queue;
        play_history history = m_history;
        auto sel = start_from_queue(queue, history);
        if (!sel.outcome) {
            end_session(notice_kind::playback_failed, sel.outcome.message);
            return;
        }
        m_queue   = std::move(queue);
        m_history = std::move(history);
        commit_now_playing(*sel.started);
        return;
    }

    case mode::autoplay: {
        if (m_deps.now() >= m_autoplay->deadline) {
            std::ostringstream oss;
            oss << "Autoplay ended after "
                << std::chrono::duration_cast<std::chrono::hours>(m_options.autoplay_window).count()
                << " hours. Played " << m_autoplay->elapsed_songs << " unique songs.";
            reset_to_idle();
            log(dpp::ll_info, oss.str());
            notify(notice_kind::session_ended, oss.str());
            return;
        }

        const std::string artist = m_autoplay->artist;
        auto r = advance_autoplay(issued);
        if (r) {
            return;
        }
        if (r.code == errc::superseded) {
            m_advance_interrupted = true;
            return;
        }
        if (r.code == errc::playback_failure) {
            notify(notice_kind::playback_failed, r.message);
        } else if (r.code == errc::no_new_candidates) {
            reset_to_idle();
            notify(notice_kind::session_ended,
                   "Ran out of new songs for " + bold(artist) + ". Stopping autoplay.");
        } else {
            m_current.reset();
            notify(notice_kind::selection_failed, r.message);
        }
        return;
    }

    case mode::radio: {
        if (m_deps.now() >= m_radio_deadline) {
            std::ostringstream oss;
            oss << "Radio ended after "
                << std::chrono::duration_cast<std::chrono::hours>(m_options.radio_window).count()
                << " hours. Played " << m_radio_tracks << " tracks.";
            reset_to_idle();
            log(dpp::ll_info, oss.str());
            notify(notice_kind::session_ended, oss.str());
            return;
        }

        auto r = advance_radio({}, issued);
        if (r) {
            return;
        }
        if (r.code == errc::superseded) {
            m_advance_interrupted = true;
            return;
        }
        if (r.code == errc::playback_failure) {
            notify(notice_kind::playback_failed, r.message);
        } else {
            m_current.reset();
            notify(notice_kind::selection_failed,
                   r.code == errc::no_new_candidates
                       ? "Running low on new tracks. Try /tune to explore a new direction."
                       : r.message);
        }
        return;
    }
    }
}

// ---------- Views ----------

queue_view session_controller::view_queue(std::size_t limit) const {
    queue_view view;
    view.now_playing = m_current;
    view.up_next     = m_queue.peek(limit);
    view.total       = m_queue.size();
    return view;
}

std::optional<signal_report> session_controller::signal() const {
    if (m_mode != mode::radio) {
        return std::nullopt;
    }
    signal_report report;
    report.description     = m_tuning->description;
    report.energy          = m_tuning->energy;
    report.elapsed_tracks  = m_radio_tracks;
    report.direction_count = m_tuning->directions.size();

    const auto left = m_radio_deadline - m_deps.now();
    if (left > session_clock::duration::zero()) {
        report.remaining = std::chrono::duration_cast<std::chrono::minutes>(left);
    }
    return report;
}

std::optional<autoplay_report> session_controller::autoplay_status() const {
    if (m_mode != mode::autoplay) {
        return std::nullopt;
    }
    autoplay_report report;
    report.artist        = m_autoplay->artist;
    report.elapsed_songs = m_autoplay->elapsed_songs;

    const auto left = m_autoplay->deadline - m_deps.now();
    if (left > session_clock::duration::zero()) {
        report.remaining = std::chrono::duration_cast<std::chrono::minutes>(left);
    }
    return report;
}

// ---------- Selection ----------

std::uint64_t session_controller::issue() const {
    return m_deps.generation ? m_deps.generation() : 0;
}

bool session_controller::stale(std::uint64_t issued) const {
    return m_deps.generation && m_deps.generation() != issued;
}

catalog::steering session_controller::radio_steering(const tuning& t, const std::set<std::string>& avoid) const {
    catalog::steering s;
    s.description = t.description;
    s.energy      = t.energy;
    s.avoid       = avoid;
    s.focus       = catalog::steering_focus::radio;

    // Recommend around what is playing, unless the listener just retuned
    // away from it or asked to avoid it.
    if (m_current && !m_seed_stale && avoid.count(m_current->id) == 0) {
        s.seed = m_current->id;
    }
    return s;
}

catalog::steering session_controller::artist_steering(const std::string& artist) const {
    catalog::steering s;
    s.description = artist;
    s.focus       = catalog::steering_focus::artist;
    return s;
}

std::optional<catalog::track> session_controller::pick(const std::vector<catalog::track>& candidates,
                                                       const play_history& history,
                                                       const std::set<std::string>& avoid) const
{
    for (const auto& candidate : candidates) {
        if (candidate.id.empty() || avoid.count(candidate.id) > 0) {
            continue;
        }
        if (history.contains(candidate)) {
            continue;
        }
        if (!is_likely_song(candidate)) {
            log(dpp::ll_debug, "Filtered out non-song: " + candidate.title);
            continue;
        }
        return candidate;
    }
    return std::nullopt;
}

session_controller::selection session_controller::select_and_start(const catalog::steering& request,
                                                                    play_history& history,
                                                                    std::uint64_t issued)
{
    catalog::steering current = request;
    int refused = 0;

    while (refused < m_options.playback_retry_cap) {
        auto found = m_deps.catalog.recommend(current);
        if (stale(issued)) {
            log(dpp::ll_debug, "Discarding recommendations for '" + current.description
                               + "': session changed meanwhile");
            return {result::failure(errc::superseded, "The session changed before a track was found."), std::nullopt};
        }
        if (found.status == catalog::catalog_status::unavailable) {
            return {result::failure(errc::catalog_unavailable,
                                    "Could not reach the catalog: " + found.error_message),
                    std::nullopt};
        }

        auto candidate = pick(found.tracks, history, current.avoid);
        if (!candidate) {
            if (!current.widened) {
                log(dpp::ll_debug, "No new candidates for '" + current.description + "', widening search");
                current.avoid.clear();
                current.seed.reset();
                current.widened = true;
                continue;
            }
            return {result::failure(errc::no_new_candidates,
                                    "No new tracks found for " + bold(request.description)),
                    std::nullopt};
        }

        // Played or refused, it is not offered again this session.
        history.insert(*candidate);

        if (m_deps.driver.start(m_guild_id, *candidate)) {
            return {result::success(), std::move(candidate)};
        }

        ++refused;
        log(dpp::ll_warning, "Player refused track " + candidate->id + " (" + candidate->title + ")");
    }

    return {result::failure(errc::playback_failure, "The player refused every track it was given."),
            std::nullopt};
}

session_controller::selection session_controller::start_from_queue(track_queue& queue, play_history& history) {
    int refused = 0;

    while (auto next = queue.dequeue()) {
        history.insert(*next);
        if (m_deps.driver.start(m_guild_id, *next)) {
            return {result::success(), std::move(next)};
        }

        log(dpp::ll_warning, "Player refused track " + next->id + " (" + next->title + ")");
        if (++refused >= m_options.playback_retry_cap) {
            break;
        }
    }

    if (refused > 0) {
        return {result::failure(errc::playback_failure, "The player refused the queued tracks."),
                std::nullopt};
    }
    return {result::failure(errc::empty_queue, "Queue is empty"), std::nullopt};
}

result session_controller::advance_autoplay(std::uint64_t issued) {
    play_history history = m_history;
    auto sel = select_and_start(artist_steering(m_autoplay->artist), history, issued);
    if (!sel.outcome) {
        if (sel.outcome.code == errc::playback_failure) {
            halt_driver();
            reset_to_idle();
        }
        return sel.outcome;
    }

    m_history = std::move(history);
    ++m_autoplay->elapsed_songs;
    commit_now_playing(*sel.started);
    return result::success();
}

result session_controller::advance_radio(const std::set<std::string>& avoid, std::uint64_t issued) {
    play_history history = m_history;
    auto sel = select_and_start(radio_steering(*m_tuning, avoid), history, issued);
    if (!sel.outcome) {
        if (sel.outcome.code == errc::playback_failure) {
            halt_driver();
            reset_to_idle();
        }
        return sel.outcome;
    }

    m_history = std::move(history);
    ++m_radio_tracks;
    commit_now_playing(*sel.started);
    return result::success();
}

// ---------- State helpers ----------

void session_controller::commit_now_playing(const catalog::track& t) {
    m_current    = t;
    m_paused     = false;
    m_seed_stale = false;
    m_advance_interrupted = false;

    std::ostringstream oss;
    oss << "Now playing " << t.id << " '" << t.title << "' (mode=" << to_string(m_mode) << ")";
    log(dpp::ll_info, oss.str());

    notify(notice_kind::now_playing, "Now playing: " + bold(t.title), t);
}

void session_controller::halt_driver() {
    if (!m_deps.driver.halt(m_guild_id)) {
        log(dpp::ll_warning, "Player did not acknowledge halt");
    }
}

void session_controller::reset_to_idle() {
    m_mode = mode::idle;
    m_current.reset();
    m_paused = false;
    m_queue.clear();
    m_history.clear();
    m_tuning.reset();
    m_autoplay.reset();
    m_radio_tracks = 0;
    m_radio_deadline = {};
    m_error_streak = 0;
    m_seed_stale   = false;
    m_abandoned_entry.reset();
    m_advance_interrupted = false;
}

void session_controller::end_session(notice_kind kind, const std::string& text) {
    halt_driver();
    reset_to_idle();
    log(dpp::ll_warning, text);
    notify(kind, text);
}

void session_controller::notify(notice_kind kind, const std::string& text,
                                std::optional<catalog::track> t) const
{
    if (!m_deps.notify) {
        return;
    }
    session_notice notice;
    notice.guild_id = m_guild_id;
    notice.kind     = kind;
    notice.text     = text;
    notice.track    = std::move(t);
    m_deps.notify(notice);
}

void session_controller::log(dpp::loglevel level, const std::string& message) const {
    std::ostringstream oss;
    oss << "[session " << m_guild_id << "] " << message;
    m_deps.log(level, oss.str());
}

} // namespace dt::session
