#include "ost/commands/interaction_storage.hpp"

namespace ost::music {

void interaction_storage::save_song_list(dpp::snowflake channel_id, std::vector<audio::song> songs)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lists[channel_id] = std::move(songs);
}

std::vector<audio::song> interaction_storage::get_song_list(dpp::snowflake channel_id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_lists.find(channel_id);
    if (it == m_lists.end()) {
        return {};
    }
    return it->second;
}

void interaction_storage::delete_song_list(dpp::snowflake channel_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lists.erase(channel_id);
}

} // namespace ost::music
