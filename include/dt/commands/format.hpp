#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "dt/session/controller.hpp"
#include "dt/session/tuning.hpp"

namespace dt::commands {

// The /queue view never lists more than this many upcoming tracks.
constexpr std::size_t queue_view_limit = 10;

/// "m:ss" or "h:mm:ss"; "Unknown" for zero or negative durations.
std::string format_duration(std::int64_t duration_ms);

/// Energy as a signed level with a word, e.g. "+1 (energetic)".
std::string format_energy(int energy);

std::string format_queue(const session::queue_view& view);
std::string format_signal(const session::signal_report& report);
std::string format_autoplay_status(const session::autoplay_report& report);
std::string format_stations(const std::vector<std::pair<std::string, session::tuning>>& stations);

/// Channel message for a session notice. Empty if there is nothing to say.
std::string format_notice(const session::session_notice& notice);

} // namespace dt::commands
