#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

#include "dt/catalog/track.hpp"

namespace dt::session {

/// Pending tracks for manual mode, in the order they were requested.
class track_queue {
public:
    void enqueue(catalog::track t);

    /// Removes and returns the head, or nullopt when empty.
    std::optional<catalog::track> dequeue();

    /// Up to n tracks from the head, without removing them.
    std::vector<catalog::track> peek(std::size_t n) const;

    void clear() { m_tracks.clear(); }

    std::size_t size() const { return m_tracks.size(); }
    bool empty() const { return m_tracks.empty(); }

private:
    std::deque<catalog::track> m_tracks;
};

} // namespace dt::session
