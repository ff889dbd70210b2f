#include "dt/session/track_queue.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace dt::session {

void track_queue::enqueue(catalog::track t) {
    m_tracks.push_back(std::move(t));
}

std::optional<catalog::track> track_queue::dequeue() {
    if (m_tracks.empty()) {
        return std::nullopt;
    }
    catalog::track head = std::move(m_tracks.front());
    m_tracks.pop_front();
    return head;
}

std::vector<catalog::track> track_queue::peek(std::size_t n) const {
    const auto count = std::min(n, m_tracks.size());
    return std::vector<catalog::track>(m_tracks.begin(), m_tracks.begin() + static_cast<std::ptrdiff_t>(count));
}

} // namespace dt::session
