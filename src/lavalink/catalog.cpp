#include "dt/lavalink/catalog.hpp"

#include <algorithm>
#include <utility>

#include "dt/session/tuning.hpp"

namespace dt::lavalink {

namespace {

bool is_url(const std::string& text) {
    return text.rfind("http://", 0) == 0 || text.rfind("https://", 0) == 0;
}

void drop_avoided(catalog::catalog_result& res, const catalog::steering& request) {
    auto& tracks = res.tracks;
    tracks.erase(std::remove_if(tracks.begin(), tracks.end(),
                                [&request](const catalog::track& t) {
                                    return request.avoid.count(t.id) > 0
                                        || (request.seed && t.id == *request.seed);
                                }),
                 tracks.end());
}

} // namespace

lavalink_catalog::lavalink_catalog(node& lavalink, std::string search_prefix)
    : m_node(lavalink)
    , m_search_prefix(std::move(search_prefix))
{
}

catalog::catalog_result lavalink_catalog::to_catalog_result(load_result res) {
    catalog::catalog_result out;
    switch (res.type) {
    case load_type::error:
        out.status = catalog::catalog_status::unavailable;
        out.error_message = std::move(res.error_message);
        return out;
    case load_type::empty:
        out.status = catalog::catalog_status::not_found;
        return out;
    case load_type::track:
    case load_type::search:
    case load_type::playlist:
        break;
    }
    out.tracks = std::move(res.tracks);
    out.status = out.tracks.empty() ? catalog::catalog_status::not_found : catalog::catalog_status::ok;
    return out;
}

catalog::catalog_result lavalink_catalog::search(const std::string& text) {
    const bool url = is_url(text);
    auto res = m_node.load_tracks(url ? text : m_search_prefix + text);

    // A text search returns a page of matches; only the best one is wanted.
    if (res.type == load_type::search && res.tracks.size() > 1) {
        res.tracks.resize(1);
    }
    return to_catalog_result(std::move(res));
}

catalog::catalog_result lavalink_catalog::recommend(const catalog::steering& request) {
    if (request.seed && !request.widened) {
        auto mix = to_catalog_result(m_node.load_tracks(mix_identifier(*request.seed)));
        if (mix.status == catalog::catalog_status::ok) {
            drop_avoided(mix, request);
            if (!mix.tracks.empty()) {
                return mix;
            }
        }
        // No usable mix for this seed: fall through to a text search.
    }

    auto res = to_catalog_result(m_node.load_tracks(m_search_prefix + steering_query(request)));
    if (res.status == catalog::catalog_status::ok) {
        drop_avoided(res, request);
    }
    return res;
}

std::string lavalink_catalog::steering_query(const catalog::steering& request) {
    switch (request.focus) {
    case catalog::steering_focus::artist:
        return request.widened ? request.description + " songs"
                               : request.description + " official audio";
    case catalog::steering_focus::radio:
        break;
    }
    if (request.widened) {
        return request.description + " songs playlist mix";
    }
    return session::build_radio_query(request.description, request.energy) + " music";
}

std::string lavalink_catalog::mix_identifier(const std::string& seed_id) {
    return "https://www.youtube.com/watch?v=" + seed_id + "&list=RD" + seed_id;
}

} // namespace dt::lavalink
