#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>

#include "dt/catalog/track.hpp"

namespace dt::session {

/// Tracks already played in the current continuous mode-session. Used only
/// for dedup: a track counts as played if its id or its normalised title
/// has been seen.
class play_history {
public:
    void insert(const catalog::track& t);

    bool contains(const catalog::track& t) const;
    bool contains_id(const std::string& id) const;

    void clear();

    /// Number of tracks inserted (distinct ids).
    std::size_t size() const { return m_ids.size(); }
    bool empty() const { return m_ids.empty(); }

private:
    std::unordered_set<std::string> m_ids;
    std::unordered_set<std::string> m_titles;
};

} // namespace dt::session
