#pragma once

#include <functional>
#include <string>

#include <dpp/snowflake.h>

#include "dt/catalog/track.hpp"

namespace dt::playback {

enum class event_kind {
    finished,
    error
};

struct playback_event {
    dpp::snowflake guild_id;
    event_kind     kind = event_kind::finished;
    std::string    track_id;
    std::string    cause; // for event_kind::error
};

using event_handler = std::function<void(const playback_event&)>;

/// Plays one track per guild. Events are delivered from the driver's own
/// threads; consumers must re-serialise them.
class playback_driver {
public:
    virtual ~playback_driver() = default;

    /// Replace whatever the guild is playing. Returns false if the backend
    /// refused the track.
    virtual bool start(dpp::snowflake guild_id, const catalog::track& t) = 0;

    virtual bool pause(dpp::snowflake guild_id) = 0;
    virtual bool resume(dpp::snowflake guild_id) = 0;
    virtual bool halt(dpp::snowflake guild_id) = 0;

    virtual void set_event_handler(event_handler handler) = 0;
};

} // namespace dt::playback
