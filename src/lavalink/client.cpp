#include "ost/lavalink/client.hpp"

#include <dpp/json.h>

#include <future>
#include <map>
#include <sstream>

namespace ost::lavalink {

using json = nlohmann::json;

namespace {

bool looks_like_url(const std::string& query)
{
    return query.rfind("http://", 0) == 0 || query.rfind("https://", 0) == 0;
}

audio::song song_from_track(const json& el)
{
    audio::song s;
    if (!el.contains("info") || !el["info"].is_object()) {
        return s;
    }

    const auto& info = el["info"];
    s.title    = info.value("title", "");
    s.url      = info.value("uri", "");
    s.duration = std::chrono::milliseconds(info.value("length", static_cast<std::int64_t>(0)));

    if (info.contains("artworkUrl") && info["artworkUrl"].is_string()) {
        s.thumbnail_url = info["artworkUrl"].get<std::string>();
    }
    if (info.value("isStream", false)) {
        s.duration = std::chrono::milliseconds(0);
    }
    return s;
}

} // namespace

load_type parse_load_type(const std::string& value)
{
    if (value == "track") {
        return load_type::track;
    } else if (value == "search") {
        return load_type::search;
    } else if (value == "playlist") {
        return load_type::playlist;
    } else if (value == "empty") {
        return load_type::empty;
    }
    return load_type::error;
}

audio::lookup_result parse_load_result(const std::string& body)
{
    audio::lookup_result res;

    json j;
    try {
        j = json::parse(body);
    } catch (const std::exception& e) {
        res.code = errc::lookup_failed;
        res.error_message = std::string("Failed to parse Lavalink response: ") + e.what();
        return res;
    }

    const std::string load_type_str = j.value("loadType", "");
    const load_type type = parse_load_type(load_type_str);

    if (type == load_type::empty) {
        res.code = errc::lookup_failed;
        res.error_message = "No matches";
        return res;
    }

    if (type == load_type::error) {
        res.code = errc::lookup_failed;
        if (load_type_str != "error") {
            res.error_message = "Unknown loadType: " + load_type_str;
        } else if (j.contains("data") && j["data"].is_object()) {
            res.error_message = j["data"].value("message", "Unknown Lavalink error");
        } else {
            res.error_message = "Unknown Lavalink error (no data field)";
        }
        return res;
    }

    // track: data is one object; search: array; playlist: {info, tracks}
    const json* tracks = nullptr;
    json single = json::array();
    if (j.contains("data")) {
        const auto& data = j["data"];
        if (type == load_type::track && data.is_object()) {
            single.push_back(data);
            tracks = &single;
        } else if (type == load_type::playlist && data.is_object() && data.contains("tracks")) {
            tracks = &data["tracks"];
        } else if (data.is_array()) {
            tracks = &data;
        }
    }

    if (tracks && tracks->is_array()) {
        for (const auto& el : *tracks) {
            audio::song s = song_from_track(el);
            if (s.url.empty()) {
                continue;
            }
            res.songs.push_back(std::move(s));
            if (type == load_type::search) {
                break;
            }
        }
    }

    if (res.songs.empty()) {
        res.code = errc::lookup_failed;
        res.error_message = "No playable tracks in response";
    }
    return res;
}

search_client::search_client(dpp::cluster& cluster, const node_config& cfg)
    : m_cluster(cluster)
    , m_cfg(cfg)
{
    std::ostringstream oss;
    oss << "Using Lavalink node at "
        << (m_cfg.https ? "https://" : "http://")
        << m_cfg.host << ":" << m_cfg.port << " for song lookup";
    m_cluster.log(dpp::ll_info, oss.str());
}

std::string search_client::http_get(const std::string& urlpath) const
{
    const std::string scheme   = m_cfg.https ? "https://" : "http://";
    const std::string full_url = scheme + m_cfg.host + ":" + std::to_string(m_cfg.port) + urlpath;

    std::multimap<std::string, std::string> headers;
    headers.emplace("Authorization", m_cfg.password);
    headers.emplace("Client-Name",   "Ostinato");

    auto prom = std::make_shared<std::promise<dpp::http_request_completion_t>>();
    auto fut  = prom->get_future();

    m_cluster.log(dpp::ll_debug, "Lavalink HTTP request: GET " + urlpath);

    m_cluster.request(
        full_url,
        dpp::m_get,
        [this, urlpath, prom](const dpp::http_request_completion_t& cc) {
            std::ostringstream oss;
            oss << "Lavalink HTTP " << cc.status
                << " on GET " << urlpath
                << " (response length=" << cc.body.size() << ")";

            if (cc.status == 0) {
                m_cluster.log(dpp::ll_warning, oss.str() + " (request failed)");
            } else if (cc.status >= 400) {
                m_cluster.log(dpp::ll_warning, oss.str() + " response: " + cc.body);
            } else {
                m_cluster.log(dpp::ll_debug, oss.str());
            }

            prom->set_value(cc);
        },
        "",
        "",
        headers
    );

    const auto cc = fut.get();
    if (cc.status == 0 || cc.status >= 400 || cc.body.empty()) {
        return {};
    }
    return cc.body;
}

audio::lookup_result search_client::lookup_songs(const std::string& query)
{
    const std::string identifier = looks_like_url(query) ? query : m_cfg.search_prefix + query;

    std::string body = http_get("/v4/loadtracks?identifier=" + dpp::utility::url_encode(identifier));
    if (body.empty()) {
        audio::lookup_result res;
        res.code = errc::lookup_failed;
        res.error_message = "Empty response from Lavalink";
        return res;
    }

    audio::lookup_result res = parse_load_result(body);
    if (!res.ok()) {
        m_cluster.log(dpp::ll_warning,
                      "Lavalink lookup for '" + query + "' failed: " + res.error_message);
    } else {
        std::ostringstream oss;
        oss << "Loaded " << res.songs.size() << " song(s) from Lavalink for: " << query;
        m_cluster.log(dpp::ll_info, oss.str());
    }
    return res;
}

} // namespace ost::lavalink
