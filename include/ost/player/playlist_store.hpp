#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <dpp/snowflake.h>

#include "ost/audio/song.hpp"
#include "ost/log.hpp"

namespace ost::player {

struct queue_entry {
    audio::song    song;
    dpp::snowflake text_channel;
    dpp::snowflake voice_channel;
};

// Durable snapshot of each guild's pending queue. Only a durability aid:
// players work the same with a store that forgets everything.
class playlist_store {
public:
    virtual ~playlist_store() = default;

    virtual std::vector<queue_entry> load(dpp::snowflake guild_id) = 0;
    virtual void save(dpp::snowflake guild_id, const std::vector<queue_entry>& entries) = 0;
};

class memory_playlist_store : public playlist_store {
public:
    std::vector<queue_entry> load(dpp::snowflake guild_id) override;
    void save(dpp::snowflake guild_id, const std::vector<queue_entry>& entries) override;

private:
    std::mutex                                          m_mutex;
    std::map<dpp::snowflake, std::vector<queue_entry>> m_entries;
};

// One <guild id>.json file per guild inside a directory.
class json_playlist_store : public playlist_store {
public:
    explicit json_playlist_store(std::string directory, log_fn log = null_log());

    std::vector<queue_entry> load(dpp::snowflake guild_id) override;
    void save(dpp::snowflake guild_id, const std::vector<queue_entry>& entries) override;

private:
    std::string path_for(dpp::snowflake guild_id) const;

    std::string m_directory;
    log_fn      m_log;
    std::mutex  m_mutex;
};

} // namespace ost::player
