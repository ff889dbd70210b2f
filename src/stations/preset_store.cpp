#include "dt/stations/preset_store.hpp"

#include <dpp/json.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

namespace dt::stations {

using json = dpp::json;

namespace {

json to_json(const session::tuning& t) {
    json j;
    j["description"] = t.description;
    j["energy"]      = t.energy;
    j["directions"]  = t.directions;
    return j;
}

session::tuning from_json(const json& j) {
    session::tuning t;
    t.description = j.value("description", "");
    t.energy      = std::clamp(j.value("energy", 0), session::min_energy, session::max_energy);
    if (j.contains("directions") && j["directions"].is_array()) {
        for (const auto& d : j["directions"]) {
            if (d.is_string()) {
                t.directions.push_back(d.get<std::string>());
            }
        }
    }
    // Files written before directions were tracked only carry the description.
    if (t.directions.empty() && !t.description.empty()) {
        t.directions.push_back(t.description);
    }
    return t;
}

} // namespace

preset_store::preset_store(std::string path, log_sink log)
    : m_path(std::move(path))
    , m_log(log ? std::move(log) : null_sink())
{
    std::lock_guard<std::mutex> lock(m_mutex);
    read_file_locked();
}

std::string preset_store::canonical_name(const std::string& name) {
    const auto first = name.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = name.find_last_not_of(" \t\r\n");
    std::string out = name.substr(first, last - first + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool preset_store::save(dpp::snowflake guild_id, const std::string& name, const session::tuning& snapshot) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_presets[guild_id][canonical_name(name)] = snapshot;

    std::ostringstream oss;
    oss << "Saved station '" << canonical_name(name) << "' for guild " << guild_id
        << " (description='" << snapshot.description << "', energy=" << snapshot.energy << ")";
    m_log(dpp::ll_info, oss.str());

    return write_file_locked();
}

std::optional<session::tuning> preset_store::load(dpp::snowflake guild_id, const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto guild = m_presets.find(guild_id);
    if (guild == m_presets.end()) {
        return std::nullopt;
    }
    auto it = guild->second.find(canonical_name(name));
    if (it == guild->second.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> preset_store::list(dpp::snowflake guild_id) const {
    std::vector<std::string> names;
    for (auto& entry : entries(guild_id)) {
        names.push_back(std::move(entry.first));
    }
    return names;
}

std::vector<std::pair<std::string, session::tuning>> preset_store::entries(dpp::snowflake guild_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::pair<std::string, session::tuning>> out;
    auto guild = m_presets.find(guild_id);
    if (guild == m_presets.end()) {
        return out;
    }
    out.assign(guild->second.begin(), guild->second.end());
    return out;
}

bool preset_store::remove(dpp::snowflake guild_id, const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto guild = m_presets.find(guild_id);
    if (guild == m_presets.end()) {
        return false;
    }
    if (guild->second.erase(canonical_name(name)) == 0) {
        return false;
    }
    if (guild->second.empty()) {
        m_presets.erase(guild);
    }

    m_log(dpp::ll_info, "Deleted station '" + canonical_name(name) + "' for guild " + guild_id.str());

    if (!write_file_locked()) {
        m_log(dpp::ll_warning, "Station deletion is not persisted for guild " + guild_id.str());
    }
    return true;
}

void preset_store::read_file_locked() {
    if (m_path.empty()) {
        return;
    }

    std::ifstream in(m_path);
    if (!in.is_open()) {
        m_log(dpp::ll_info, "No station file at " + m_path + ", starting empty");
        return;
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        m_log(dpp::ll_warning,
              "Failed to parse station file " + m_path + ": " + e.what() + " (starting empty)");
        return;
    }

    if (!j.is_object()) {
        m_log(dpp::ll_warning, "Station file " + m_path + " is not an object (starting empty)");
        return;
    }

    std::size_t count = 0;
    for (const auto& [guild_key, stations] : j.items()) {
        if (!stations.is_object()) {
            continue;
        }
        dpp::snowflake guild_id;
        try {
            guild_id = dpp::snowflake(std::stoull(guild_key));
        } catch (const std::exception&) {
            m_log(dpp::ll_warning, "Ignoring stations under invalid guild id '" + guild_key + "'");
            continue;
        }
        for (const auto& [name, data] : stations.items()) {
            if (!data.is_object()) {
                continue;
            }
            m_presets[guild_id][canonical_name(name)] = from_json(data);
            ++count;
        }
    }

    std::ostringstream oss;
    oss << "Loaded " << count << " station(s) for " << m_presets.size()
        << " guild(s) from " << m_path;
    m_log(dpp::ll_info, oss.str());
}

bool preset_store::write_file_locked() const {
    if (m_path.empty()) {
        return true;
    }

    json j = json::object();
    for (const auto& [guild_id, stations] : m_presets) {
        json& guild = j[guild_id.str()];
        guild = json::object();
        for (const auto& [name, snapshot] : stations) {
            guild[name] = to_json(snapshot);
        }
    }

    const std::string tmp_path = m_path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            m_log(dpp::ll_warning, "Failed to open " + tmp_path + " for writing");
            return false;
        }
        out << j.dump(2);
        if (!out.good()) {
            m_log(dpp::ll_warning, "Failed to write stations to " + tmp_path);
            return false;
        }
    }

    if (std::rename(tmp_path.c_str(), m_path.c_str()) != 0) {
        m_log(dpp::ll_warning, "Failed to move " + tmp_path + " over " + m_path);
        return false;
    }
    return true;
}

} // namespace dt::stations
