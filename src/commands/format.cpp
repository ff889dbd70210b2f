#include "dt/commands/format.hpp"

#include <iomanip>
#include <sstream>

namespace dt::commands {

std::string format_duration(std::int64_t duration_ms) {
    if (duration_ms <= 0) {
        return "Unknown";
    }
    const std::int64_t total   = duration_ms / 1000;
    const std::int64_t hours   = total / 3600;
    const std::int64_t minutes = (total / 60) % 60;
    const std::int64_t seconds = total % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << ":" << std::setw(2) << std::setfill('0') << minutes
            << ":" << std::setw(2) << std::setfill('0') << seconds;
    } else {
        oss << minutes << ":" << std::setw(2) << std::setfill('0') << seconds;
    }
    return oss.str();
}

std::string format_energy(int energy) {
    const char* word = "neutral";
    if (energy <= -2) {
        word = "very chill";
    } else if (energy == -1) {
        word = "chill";
    } else if (energy == 1) {
        word = "energetic";
    } else if (energy >= 2) {
        word = "hype";
    }

    std::ostringstream oss;
    oss << std::showpos << energy << std::noshowpos << " (" << word << ")";
    return oss.str();
}

std::string format_queue(const session::queue_view& view) {
    if (!view.now_playing && view.up_next.empty()) {
        return "Queue is empty";
    }

    std::ostringstream oss;
    if (view.now_playing) {
        oss << "**Now playing:** " << view.now_playing->title
            << " [" << format_duration(view.now_playing->duration_ms) << "]";
    }

    if (!view.up_next.empty()) {
        if (view.now_playing) {
            oss << "\n\n";
        }
        oss << "**Up next (" << view.total << " tracks):**";
        std::size_t i = 1;
        for (const auto& t : view.up_next) {
            oss << "\n" << i++ << ". " << t.title;
        }
        if (view.total > view.up_next.size()) {
            oss << "\n...and " << (view.total - view.up_next.size()) << " more";
        }
    }
    return oss.str();
}

std::string format_signal(const session::signal_report& report) {
    std::ostringstream oss;
    oss << "**Radio Signal**\n"
        << "Tuned to: **" << report.description << "**\n"
        << "Energy: " << format_energy(report.energy) << "\n"
        << "Tracks played: " << report.elapsed_tracks << "\n"
        << "Directions taken: " << report.direction_count << "\n"
        << "Time remaining: " << report.remaining.count() << " minutes";
    return oss.str();
}

std::string format_autoplay_status(const session::autoplay_report& report) {
    std::ostringstream oss;
    oss << "Autoplay: **" << report.artist << "**\n"
        << "Songs played: " << report.elapsed_songs << "\n"
        << "Time remaining: " << report.remaining.count() << " minutes";
    return oss.str();
}

std::string format_stations(const std::vector<std::pair<std::string, session::tuning>>& stations) {
    if (stations.empty()) {
        return "No saved stations. Use `/station save <name>` while radio is playing.";
    }

    std::ostringstream oss;
    oss << "**Saved stations:**";
    for (const auto& [name, snapshot] : stations) {
        oss << "\n- **" << name << "** - " << snapshot.description;
        if (snapshot.energy != 0) {
            oss << " [energy " << format_energy(snapshot.energy) << "]";
        }
    }
    return oss.str();
}

std::string format_notice(const session::session_notice& notice) {
    switch (notice.kind) {
    case session::notice_kind::now_playing:
        if (notice.track) {
            return "**Now playing:** " + notice.track->title
                   + " [" + format_duration(notice.track->duration_ms) + "]";
        }
        break;
    case session::notice_kind::playback_failed:
        if (!notice.text.empty()) {
            return "Playback problem: " + notice.text;
        }
        break;
    case session::notice_kind::session_ended:
    case session::notice_kind::selection_failed:
        break;
    }
    return notice.text;
}

} // namespace dt::commands
