#include "dt/session/errors.hpp"

namespace dt::session {

const char* to_string(errc code) {
    switch (code) {
    case errc::ok:                  return "ok";
    case errc::mode_conflict:       return "mode_conflict";
    case errc::empty_queue:         return "empty_queue";
    case errc::not_playing:         return "not_playing";
    case errc::not_in_radio:        return "not_in_radio";
    case errc::not_in_autoplay:     return "not_in_autoplay";
    case errc::no_new_candidates:   return "no_new_candidates";
    case errc::preset_not_found:    return "preset_not_found";
    case errc::catalog_unavailable: return "catalog_unavailable";
    case errc::playback_failure:    return "playback_failure";
    case errc::not_found:           return "not_found";
    case errc::superseded:          return "superseded";
    }
    return "unknown";
}

} // namespace dt::session
