#pragma once

#include <string>

#include <dpp/snowflake.h>

#include "dt/session/controller.hpp"
#include "dt/session/errors.hpp"
#include "dt/stations/preset_store.hpp"

namespace dt::stations {

// The /station subcommands. Each runs on the guild's session worker, so the
// snapshot taken or applied is consistent with the session at that moment.

/// Snapshot the running radio under `name`. not_in_radio outside radio mode.
session::result save_station(session::session_controller& session, preset_store& store,
                             dpp::snowflake guild_id, const std::string& name);

/// Start radio from a saved snapshot. preset_not_found if absent,
/// mode_conflict if another mode is running.
session::result load_station(session::session_controller& session, const preset_store& store,
                             dpp::snowflake guild_id, const std::string& name);

/// preset_not_found if there was nothing to delete.
session::result delete_station(preset_store& store, dpp::snowflake guild_id, const std::string& name);

} // namespace dt::stations
