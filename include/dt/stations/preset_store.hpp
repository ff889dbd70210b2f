#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <dpp/snowflake.h>

#include "dt/logging.hpp"
#include "dt/session/tuning.hpp"

namespace dt::stations {

/// Saved radio stations, keyed by guild then by name. Everything is loaded
/// from the JSON file on construction and the file is rewritten on every
/// change. Names are trimmed and lower-cased, so lookups are
/// case-insensitive. Safe to share between guild workers.
class preset_store {
public:
    /// An empty path keeps the store in memory only.
    preset_store(std::string path, log_sink log);

    /// Insert or overwrite. Returns false if the file could not be written;
    /// the in-memory copy is updated either way.
    bool save(dpp::snowflake guild_id, const std::string& name, const session::tuning& snapshot);

    std::optional<session::tuning> load(dpp::snowflake guild_id, const std::string& name) const;

    /// Names in lexicographic order.
    std::vector<std::string> list(dpp::snowflake guild_id) const;

    /// Name and snapshot pairs, in the same order as list().
    std::vector<std::pair<std::string, session::tuning>> entries(dpp::snowflake guild_id) const;

    /// False if there was nothing to remove.
    bool remove(dpp::snowflake guild_id, const std::string& name);

    static std::string canonical_name(const std::string& name);

private:
    using guild_presets = std::map<std::string, session::tuning>;

    std::string m_path;
    log_sink    m_log;

    mutable std::mutex                      m_mutex;
    std::map<dpp::snowflake, guild_presets> m_presets;

    void read_file_locked();
    bool write_file_locked() const;
};

} // namespace dt::stations
