#include "ost/player/playlist_store.hpp"

#include <dpp/json.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace ost::player {

using json = nlohmann::json;

std::vector<queue_entry> memory_playlist_store::load(dpp::snowflake guild_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(guild_id);
    if (it == m_entries.end()) {
        return {};
    }
    return it->second;
}

void memory_playlist_store::save(dpp::snowflake guild_id, const std::vector<queue_entry>& entries)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (entries.empty()) {
        m_entries.erase(guild_id);
    } else {
        m_entries[guild_id] = entries;
    }
}

// ---------- json_playlist_store ----------

namespace {

json to_json(const queue_entry& e)
{
    json j;
    j["url"]           = e.song.url;
    j["title"]         = e.song.title;
    j["duration_ms"]   = e.song.duration.count();
    j["requested_by"]  = e.song.requested_by;
    j["text_channel"]  = e.text_channel.str();
    j["voice_channel"] = e.voice_channel.str();
    if (e.song.thumbnail_url) {
        j["thumbnail_url"] = *e.song.thumbnail_url;
    }
    return j;
}

queue_entry from_json(const json& j)
{
    queue_entry e;
    e.song.url          = j.value("url", "");
    e.song.title        = j.value("title", "");
    e.song.duration     = std::chrono::milliseconds(j.value("duration_ms", static_cast<std::int64_t>(0)));
    e.song.requested_by = j.value("requested_by", "");
    if (j.contains("thumbnail_url") && j["thumbnail_url"].is_string()) {
        e.song.thumbnail_url = j["thumbnail_url"].get<std::string>();
    }
    e.text_channel  = dpp::snowflake(std::stoull(j.value("text_channel", "0")));
    e.voice_channel = dpp::snowflake(std::stoull(j.value("voice_channel", "0")));
    return e;
}

} // namespace

json_playlist_store::json_playlist_store(std::string directory, log_fn log)
    : m_directory(std::move(directory))
    , m_log(std::move(log))
{
    std::error_code ec;
    std::filesystem::create_directories(m_directory, ec);
    if (ec) {
        m_log(dpp::ll_error, "Cannot create playlist store directory " + m_directory + ": " + ec.message());
    }
}

std::string json_playlist_store::path_for(dpp::snowflake guild_id) const
{
    return (std::filesystem::path(m_directory) / (guild_id.str() + ".json")).string();
}

std::vector<queue_entry> json_playlist_store::load(dpp::snowflake guild_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    std::ifstream in(path_for(guild_id));
    if (!in.is_open()) {
        return {};
    }

    std::vector<queue_entry> entries;
    try {
        json j = json::parse(in);
        if (!j.is_array()) {
            m_log(dpp::ll_warning, "Playlist snapshot for guild " + guild_id.str() + " is not an array, ignoring");
            return {};
        }
        for (const auto& el : j) {
            entries.push_back(from_json(el));
        }
    } catch (const std::exception& e) {
        m_log(dpp::ll_warning,
              "Failed to read playlist snapshot for guild " + guild_id.str() + ": " + e.what());
        return {};
    }

    std::ostringstream oss;
    oss << "Restored " << entries.size() << " queued song(s) for guild " << guild_id;
    m_log(dpp::ll_info, oss.str());
    return entries;
}

void json_playlist_store::save(dpp::snowflake guild_id, const std::vector<queue_entry>& entries)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string path = path_for(guild_id);

    if (entries.empty()) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        return;
    }

    json j = json::array();
    for (const auto& e : entries) {
        j.push_back(to_json(e));
    }

    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            m_log(dpp::ll_error, "Cannot write playlist snapshot " + tmp);
            return;
        }
        out << j.dump(2);
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        m_log(dpp::ll_error, "Cannot replace playlist snapshot " + path + ": " + ec.message());
    }
}

} // namespace ost::player
