#include "dt/lavalink/client.hpp"

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <sstream>

namespace dt::lavalink {

namespace {

// Upper bound on one REST call; a session worker is blocked for this long at most.
constexpr std::chrono::seconds request_timeout{15};

} // namespace

node::node(dpp::cluster& cluster, const node_config& cfg)
    : m_cluster(cluster)
    , m_cfg(cfg)
    , m_session_id(cfg.session_id)
{
    std::ostringstream oss;
    oss << "Initialising Lavalink node at "
        << (m_cfg.https ? "https://" : "http://")
        << m_cfg.host << ":" << m_cfg.port
        << " with session_id='" << m_session_id << "'";
    m_cluster.log(dpp::ll_info, oss.str());
}

void node::handle_voice_state_update(const dpp::voice_state_update_t& ev)
{
    // Only cache our own bot's voice state
    if (ev.state.user_id != m_cluster.me.id) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_voice_mutex);
    auto& vs = m_voice_states[ev.state.guild_id];
    vs.session_id = ev.state.session_id;

    std::ostringstream oss;
    oss << "Cached voice_state for guild " << ev.state.guild_id
        << " session_id=" << vs.session_id;
    m_cluster.log(dpp::ll_debug, oss.str());
}

void node::handle_voice_server_update(const dpp::voice_server_update_t& ev)
{
    std::lock_guard<std::mutex> lock(m_voice_mutex);
    auto& vs = m_voice_states[ev.guild_id];
    vs.token    = ev.token;
    vs.endpoint = ev.endpoint;

    std::ostringstream oss;
    oss << "Cached voice_server for guild " << ev.guild_id
        << " token=" << (!vs.token.empty() ? "<set>" : "<empty>")
        << " endpoint=" << vs.endpoint;
    m_cluster.log(dpp::ll_debug, oss.str());
}

std::optional<node::voice_state> node::get_voice_state_locked(dpp::snowflake guild_id) const
{
    auto it = m_voice_states.find(guild_id);
    if (it == m_voice_states.end()) {
        return std::nullopt;
    }
    const auto& vs = it->second;
    if (vs.token.empty() || vs.endpoint.empty() || vs.session_id.empty()) {
        return std::nullopt;
    }
    return vs;
}

node::http_response node::http_request(const std::string& method,
                                       const std::string& urlpath,
                                       const std::string& body_json) const
{
    dpp::http_method http_method_enum = dpp::m_get;
    if (method == "POST") {
        http_method_enum = dpp::m_post;
    } else if (method == "PATCH") {
        http_method_enum = dpp::m_patch;
    } else if (method == "DELETE") {
        http_method_enum = dpp::m_delete;
    } else if (method == "PUT") {
        http_method_enum = dpp::m_put;
    }

    const std::string scheme   = m_cfg.https ? "https://" : "http://";
    const std::string full_url = scheme + m_cfg.host + ":" + std::to_string(m_cfg.port) + urlpath;

    std::multimap<std::string, std::string> headers;
    headers.emplace("Authorization", m_cfg.password);
    headers.emplace("User-Id",       m_cluster.me.id.str());
    headers.emplace("Client-Name",   "Dialtone");

    auto prom = std::make_shared<std::promise<dpp::http_request_completion_t>>();
    auto fut  = prom->get_future();

    m_cluster.log(
        dpp::ll_debug,
        "Lavalink HTTP request: " + method + " " + urlpath +
        " (URL=" + full_url + ", body=" +
        (body_json.empty() ? "empty" : std::to_string(body_json.size()) + " bytes") + ")"
    );

    m_cluster.request(
        full_url,
        http_method_enum,
        [this, method, urlpath, full_url, prom](const dpp::http_request_completion_t& cc) {
            std::ostringstream oss;
            oss << "Lavalink HTTP " << cc.status
                << " on " << method << " " << urlpath
                << " (URL=" << full_url
                << ", response length=" << cc.body.size() << ")";

            if (cc.status == 0) {
                m_cluster.log(dpp::ll_warning, oss.str() + " (request failed)");
            } else if (cc.status >= 400) {
                m_cluster.log(dpp::ll_warning, oss.str() + " response: " + cc.body);
            } else {
                m_cluster.log(dpp::ll_debug, oss.str());
            }

            prom->set_value(cc);
        },
        body_json,
        body_json.empty() ? "" : "application/json",
        headers
    );

    if (fut.wait_for(request_timeout) != std::future_status::ready) {
        m_cluster.log(dpp::ll_warning, "Lavalink HTTP " + method + " " + urlpath + " timed out");
        return {};
    }
    const auto cc = fut.get();

    http_response res;
    res.status = static_cast<uint16_t>(cc.status);
    res.body   = cc.body;
    return res;
}

void node::ensure_session()
{
    json payload;
    payload["resuming"] = true;
    payload["timeout"]  = 60;

    const std::string path = "/v4/sessions/" + m_session_id;

    m_cluster.log(dpp::ll_debug,
                  "Ensuring Lavalink session '" + m_session_id + "' via PATCH " + path);

    const auto res = http_request("PATCH", path, payload.dump());
    if (res.status < 200 || res.status >= 300) {
        m_cluster.log(dpp::ll_warning,
                      "Failed to ensure Lavalink session '" + m_session_id + "'");
        return;
    }

    m_cluster.log(dpp::ll_info, "Lavalink session '" + m_session_id + "' ensured");
}

catalog::track node::parse_track(const json& el)
{
    catalog::track t;
    t.encoded = el.value("encoded", "");

    if (el.contains("info") && el["info"].is_object()) {
        const auto& info = el["info"];
        t.id          = info.value("identifier", "");
        t.title       = info.value("title", "");
        t.artist      = info.value("author", "");
        t.duration_ms = info.value("length", static_cast<std::int64_t>(0));
        t.uri         = info.value("uri", "");
        t.is_stream   = info.value("isStream", false);
    }
    return t;
}

load_result node::parse_load_result(const std::string& body)
{
    load_result res;

    json j;
    try {
        j = json::parse(body);
    } catch (const std::exception& e) {
        res.type = load_type::error;
        res.error_message = std::string("Failed to parse Lavalink response: ") + e.what();
        return res;
    }

    const std::string load_type_str = j.value("loadType", "");

    if (load_type_str == "track") {
        res.type = load_type::track;
    } else if (load_type_str == "search") {
        res.type = load_type::search;
    } else if (load_type_str == "playlist") {
        res.type = load_type::playlist;
    } else if (load_type_str == "empty") {
        res.type = load_type::empty;
    } else if (load_type_str == "error") {
        res.type = load_type::error;
        if (j.contains("data") && j["data"].is_object()) {
            res.error_message = j["data"].value("message", "Unknown Lavalink error");
        } else {
            res.error_message = "Unknown Lavalink error (no data field)";
        }
    } else {
        res.type = load_type::error;
        res.error_message = "Unknown loadType: " + load_type_str;
    }

    if (!j.contains("data")) {
        return res;
    }
    const auto& data = j["data"];

    // v4 shapes: track -> object, search -> array, playlist -> {"tracks": [...]}
    if (res.type == load_type::track && data.is_object()) {
        res.tracks.push_back(parse_track(data));
    } else if (res.type == load_type::search && data.is_array()) {
        for (const auto& el : data) {
            res.tracks.push_back(parse_track(el));
        }
    } else if (res.type == load_type::playlist && data.is_object()
               && data.contains("tracks") && data["tracks"].is_array()) {
        for (const auto& el : data["tracks"]) {
            res.tracks.push_back(parse_track(el));
        }
    }

    return res;
}

load_result node::load_tracks(const std::string& identifier) const
{
    m_cluster.log(
        dpp::ll_debug,
        "Requesting /v4/loadtracks for identifier: " + identifier
    );

    const std::string path = "/v4/loadtracks?identifier=" + dpp::utility::url_encode(identifier);
    const auto resp = http_request("GET", path, {});

    if (resp.status == 0 || resp.status >= 400 || resp.body.empty()) {
        m_cluster.log(
            dpp::ll_warning,
            "No usable response from Lavalink /loadtracks for identifier: " + identifier
        );
        load_result res;
        res.type = load_type::error;
        res.error_message = resp.status == 0
            ? "Lavalink is unreachable"
            : "Lavalink returned HTTP " + std::to_string(resp.status);
        return res;
    }

    auto res = parse_load_result(resp.body);

    if (res.type == load_type::error) {
        m_cluster.log(
            dpp::ll_warning,
            "Lavalink /loadtracks error for identifier '" + identifier +
            "': " + res.error_message
        );
    } else {
        std::ostringstream oss;
        oss << "Loaded " << res.tracks.size()
            << " track(s) from Lavalink for identifier: " << identifier;
        m_cluster.log(dpp::ll_info, oss.str());
    }

    return res;
}

bool node::send_player_update(dpp::snowflake guild_id,
                              const std::string& body_json,
                              bool log_payload)
{
    if (m_session_id.empty()) {
        m_cluster.log(
            dpp::ll_warning,
            "Cannot send player update: session id is empty"
        );
        return false;
    }

    const std::string path = "/v4/sessions/" + m_session_id +
                             "/players/" + guild_id.str();

    if (log_payload) {
        std::ostringstream oss;
        oss << "Sending player update to Lavalink for guild "
            << guild_id << ": " << body_json;
        m_cluster.log(dpp::ll_debug, oss.str());
    }

    const auto resp = http_request("PATCH", path, body_json);
    return resp.status >= 200 && resp.status < 300;
}

bool node::play(dpp::snowflake guild_id, const std::string& encoded_track)
{
    json payload;
    payload["track"]["encoded"] = encoded_track;
    payload["paused"]           = false;
    payload["position"]         = 0;

    std::optional<voice_state> vs;
    {
        std::lock_guard<std::mutex> lock(m_voice_mutex);
        vs = get_voice_state_locked(guild_id);
    }

    if (vs.has_value()) {
        payload["voice"]["token"]     = vs->token;
        payload["voice"]["endpoint"]  = vs->endpoint;
        payload["voice"]["sessionId"] = vs->session_id;
    }

    std::ostringstream oss;
    oss << "Sending play to Lavalink for guild " << guild_id
        << (vs.has_value() ? "" : " (no voice state cached yet)");
    m_cluster.log(dpp::ll_info, oss.str());

    return send_player_update(guild_id, payload.dump(), /*log_payload=*/true);
}

bool node::stop(dpp::snowflake guild_id)
{
    json payload;
    payload["track"]["encoded"] = nullptr;

    m_cluster.log(
        dpp::ll_info,
        "Sending stop to Lavalink for guild " + guild_id.str()
    );

    return send_player_update(guild_id, payload.dump(), /*log_payload=*/true);
}

bool node::pause(dpp::snowflake guild_id, bool pause_flag)
{
    json payload;
    payload["paused"] = pause_flag;

    std::ostringstream oss;
    oss << "Sending pause=" << std::boolalpha << pause_flag
        << " to Lavalink for guild " << guild_id;
    m_cluster.log(dpp::ll_info, oss.str());

    return send_player_update(guild_id, payload.dump(), /*log_payload=*/true);
}

std::optional<player_state> node::get_player(dpp::snowflake guild_id) const
{
    if (m_session_id.empty()) {
        return std::nullopt;
    }

    const std::string path = "/v4/sessions/" + m_session_id +
                             "/players/" + guild_id.str();
    const auto resp = http_request("GET", path, {});

    if (resp.status == 404) {
        return player_state{}; // no player yet
    }
    if (resp.status < 200 || resp.status >= 300) {
        return std::nullopt;
    }

    auto state = parse_player(resp.body);
    if (!state) {
        m_cluster.log(dpp::ll_warning, "Failed to parse Lavalink player response for guild " + guild_id.str());
    }
    return state;
}

std::optional<player_state> node::parse_player(const std::string& body)
{
    json j;
    try {
        j = json::parse(body);
    } catch (const std::exception&) {
        return std::nullopt;
    }

    player_state state;
    if (j.contains("track") && j["track"].is_object()) {
        state.track = parse_track(j["track"]);
    }
    if (j.contains("state") && j["state"].is_object()) {
        state.position_ms = j["state"].value("position", static_cast<std::int64_t>(0));
    }
    return state;
}

} // namespace dt::lavalink
