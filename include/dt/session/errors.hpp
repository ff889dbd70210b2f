#pragma once

#include <string>
#include <utility>

namespace dt::session {

enum class errc {
    ok,
    mode_conflict,       // requested mode incompatible with the current one
    empty_queue,
    not_playing,
    not_in_radio,
    not_in_autoplay,
    no_new_candidates,   // every candidate was a duplicate
    preset_not_found,
    catalog_unavailable,
    playback_failure,
    not_found,           // search matched nothing
    superseded           // a newer mode change made this result stale
};

const char* to_string(errc code);

struct result {
    errc        code = errc::ok;
    std::string message;

    bool ok() const { return code == errc::ok; }
    explicit operator bool() const { return ok(); }

    static result success(std::string msg = {}) {
        return {errc::ok, std::move(msg)};
    }
    static result failure(errc c, std::string msg) {
        return {c, std::move(msg)};
    }
};

} // namespace dt::session
