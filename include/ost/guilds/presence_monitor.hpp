#pragma once

#include <chrono>
#include <cstddef>
#include <thread>

#include <dpp/snowflake.h>

#include "ost/cancel_token.hpp"
#include "ost/guilds/registry.hpp"
#include "ost/log.hpp"

namespace ost::guilds {

class presence_query {
public:
    virtual ~presence_query() = default;

    // Members currently in the voice channel, the bot included.
    virtual std::size_t occupancy(dpp::snowflake guild_id, dpp::snowflake channel_id) = 0;
};

// Stops players whose voice channel has nobody left but the bot.
class presence_monitor {
public:
    presence_monitor(guild_registry& registry,
                     presence_query& presence,
                     const cancel_token& shutdown,
                     std::chrono::milliseconds interval = std::chrono::minutes(1),
                     log_fn log = null_log());

    // Joins the thread; the shutdown token must have been cancelled.
    ~presence_monitor();

    presence_monitor(const presence_monitor&) = delete;
    presence_monitor& operator=(const presence_monitor&) = delete;

    void start();

    // One pass over every player. Returns how many were stopped.
    std::size_t check_once();

private:
    void run();

    guild_registry&           m_registry;
    presence_query&           m_presence;
    const cancel_token&       m_shutdown;
    std::chrono::milliseconds m_interval;
    log_fn                    m_log;
    std::thread               m_thread;
};

} // namespace ost::guilds
