#pragma once

#include <cstdint>
#include <string>

#include "dt/catalog/track.hpp"

namespace dt::session {

// Known durations outside this window are not treated as songs.
constexpr std::int64_t min_song_duration_ms = 90 * 1000;
constexpr std::int64_t max_song_duration_ms = 600 * 1000;

/// Lower-cases a title and strips upload noise ("(Official Video)", "[Lyrics]",
/// "| channel", " - Topic", ...) so re-uploads of one song compare equal.
std::string normalize_title(const std::string& title);

/// False for interviews, podcasts, reactions, full albums, compilations,
/// hour-long mixes and the like, or for a known duration outside the song
/// window. A duration of 0 means unknown and passes.
bool is_likely_song(const std::string& title, std::int64_t duration_ms = 0);

inline bool is_likely_song(const catalog::track& t) {
    return !t.is_stream && is_likely_song(t.title, t.duration_ms);
}

} // namespace dt::session
