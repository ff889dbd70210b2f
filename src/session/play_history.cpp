#include "dt/session/play_history.hpp"

#include "dt/session/track_filter.hpp"

#include <utility>

namespace dt::session {

void play_history::insert(const catalog::track& t) {
    if (!t.id.empty()) {
        m_ids.insert(t.id);
    }
    auto title = normalize_title(t.title);
    if (!title.empty()) {
        m_titles.insert(std::move(title));
    }
}

bool play_history::contains(const catalog::track& t) const {
    if (contains_id(t.id)) {
        return true;
    }
    const auto title = normalize_title(t.title);
    return !title.empty() && m_titles.count(title) > 0;
}

bool play_history::contains_id(const std::string& id) const {
    return !id.empty() && m_ids.count(id) > 0;
}

void play_history::clear() {
    m_ids.clear();
    m_titles.clear();
}

} // namespace dt::session
