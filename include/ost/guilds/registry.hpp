#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include <dpp/snowflake.h>

#include "ost/log.hpp"
#include "ost/player/player.hpp"

namespace ost::guilds {

// Guild lifecycle events, fed by whatever platform binding is in use.
class guild_events {
public:
    virtual ~guild_events() = default;

    virtual void on_guild_join(dpp::snowflake guild_id) = 0;
    virtual void on_guild_leave(dpp::snowflake guild_id) = 0;
};

// Ownership table guild id -> player. Only join/leave (and lookup-or-create)
// add or drop entries. The table lock is never held across a blocking player
// call (stop, add_song).
class guild_registry : public guild_events {
public:
    using player_ptr = std::shared_ptr<player::guild_player>;
    using factory_fn = std::function<player_ptr(dpp::snowflake)>;

    explicit guild_registry(factory_fn factory, log_fn log = null_log());
    ~guild_registry() override;

    guild_registry(const guild_registry&) = delete;
    guild_registry& operator=(const guild_registry&) = delete;

    void on_guild_join(dpp::snowflake guild_id) override;
    void on_guild_leave(dpp::snowflake guild_id) override;

    // A stopped (closed) player is replaced by a fresh one. The factory runs
    // outside the table lock and must return a player that is not started yet;
    // the registry starts the one it keeps.
    player_ptr get_or_create(dpp::snowflake guild_id);

    std::vector<player_ptr> players() const;
    std::size_t size() const;

    // Shuts every player down, keeping saved queues, and empties the table.
    void shutdown();

private:
    factory_fn m_factory;
    log_fn     m_log;

    mutable std::mutex                              m_mutex;
    std::unordered_map<dpp::snowflake, player_ptr> m_players;
};

} // namespace ost::guilds
