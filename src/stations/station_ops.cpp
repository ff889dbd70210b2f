#include "dt/stations/station_ops.hpp"

namespace dt::stations {

using session::errc;
using session::result;

result save_station(session::session_controller& session, preset_store& store,
                    dpp::snowflake guild_id, const std::string& name)
{
    const auto key = preset_store::canonical_name(name);
    if (key.empty()) {
        return result::failure(errc::preset_not_found, "Please provide a station name");
    }

    auto snapshot = session.tuning_snapshot();
    if (!snapshot) {
        return result::failure(errc::not_in_radio, "Radio is not running. Start with /radio <description>");
    }

    if (!store.save(guild_id, key, *snapshot)) {
        return result::success("Station **" + key + "** saved for now, but could not be written to disk");
    }
    return result::success("Station **" + key + "** saved!");
}

result load_station(session::session_controller& session, const preset_store& store,
                    dpp::snowflake guild_id, const std::string& name)
{
    const auto key = preset_store::canonical_name(name);
    auto snapshot = store.load(guild_id, key);
    if (!snapshot) {
        return result::failure(errc::preset_not_found,
                               "Station **" + key + "** not found. Use /stations to see saved stations.");
    }
    return session.load_station(*snapshot);
}

result delete_station(preset_store& store, dpp::snowflake guild_id, const std::string& name) {
    const auto key = preset_store::canonical_name(name);
    if (!store.remove(guild_id, key)) {
        return result::failure(errc::preset_not_found, "Station **" + key + "** not found.");
    }
    return result::success("Station **" + key + "** deleted.");
}

} // namespace dt::stations
