#include "ost/guilds/registry.hpp"

#include <sstream>

namespace ost::guilds {

guild_registry::guild_registry(factory_fn factory, log_fn log)
    : m_factory(std::move(factory))
    , m_log(std::move(log))
{
}

guild_registry::~guild_registry()
{
    shutdown();
}

void guild_registry::on_guild_join(dpp::snowflake guild_id)
{
    get_or_create(guild_id);
    m_log(dpp::ll_info, "Connected to guild " + guild_id.str());
}

void guild_registry::on_guild_leave(dpp::snowflake guild_id)
{
    player_ptr player;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_players.find(guild_id);
        if (it == m_players.end()) {
            return;
        }
        player = std::move(it->second);
        m_players.erase(it);
    }

    player->stop();
    m_log(dpp::ll_info, "Removed player for guild " + guild_id.str());
}

guild_registry::player_ptr guild_registry::get_or_create(dpp::snowflake guild_id)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_players.find(guild_id);
        if (it != m_players.end() && it->second->state() != player::player_state::closed) {
            return it->second;
        }
    }

    // Building a player reads its saved queue; keep that off the table lock.
    player_ptr created = m_factory(guild_id);

    player_ptr stale;
    player_ptr winner;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_players.find(guild_id);
        if (it != m_players.end() && it->second->state() != player::player_state::closed) {
            winner = it->second;
        } else {
            if (it != m_players.end()) {
                stale = std::move(it->second);
            }
            m_players[guild_id] = created;
            winner = created;
        }
    }

    if (winner == created) {
        created->start();
    } else {
        // Lost the race; never started, so dropping it touches nothing.
        created.reset();
    }

    // The old player's last reference may join its worker; not under the lock.
    stale.reset();
    return winner;
}

std::vector<guild_registry::player_ptr> guild_registry::players() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<player_ptr> out;
    out.reserve(m_players.size());
    for (const auto& [id, player] : m_players) {
        out.push_back(player);
    }
    return out;
}

std::size_t guild_registry::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_players.size();
}

void guild_registry::shutdown()
{
    std::unordered_map<dpp::snowflake, player_ptr> players;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        players.swap(m_players);
    }
    if (players.empty()) {
        return;
    }

    for (auto& [id, player] : players) {
        player->shutdown();
    }

    std::ostringstream oss;
    oss << "Shut down " << players.size() << " player(s)";
    m_log(dpp::ll_info, oss.str());
}

} // namespace ost::guilds
