#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "dt/catalog/track.hpp"

namespace dt::catalog {

enum class catalog_status {
    ok,
    not_found,
    unavailable
};

struct catalog_result {
    catalog_status     status = catalog_status::not_found;
    std::vector<track> tracks;
    std::string        error_message; // for catalog_status::unavailable
};

// What a recommendation is steered towards.
enum class steering_focus {
    radio,  // freeform description
    artist  // songs by one artist (autoplay)
};

struct steering {
    std::string                description;
    int                        energy = 0;
    std::set<std::string>      avoid;   // track ids the caller does not want back
    std::optional<std::string> seed;    // track id to recommend around
    steering_focus             focus = steering_focus::radio;
    bool                       widened = false;
};

/// Search and recommendation backend. Implementations may block on the
/// network; callers serialise per guild.
class catalog_client {
public:
    virtual ~catalog_client() = default;

    /// Resolve free text or a URL. A playlist URL yields several tracks,
    /// a text search yields the best match.
    virtual catalog_result search(const std::string& text) = 0;

    /// Ordered candidates for the given steering. May be empty.
    virtual catalog_result recommend(const steering& request) = 0;
};

} // namespace dt::catalog
