#pragma once

#include <map>
#include <mutex>
#include <vector>

#include <dpp/snowflake.h>

#include "ost/audio/song.hpp"

namespace ost::music {

// Lookup results waiting for the user to pick "song" or "playlist" in the
// select menu, keyed by text channel.
class interaction_storage {
public:
    void save_song_list(dpp::snowflake channel_id, std::vector<audio::song> songs);
    std::vector<audio::song> get_song_list(dpp::snowflake channel_id) const;
    void delete_song_list(dpp::snowflake channel_id);

private:
    mutable std::mutex                                  m_mutex;
    std::map<dpp::snowflake, std::vector<audio::song>> m_lists;
};

} // namespace ost::music
