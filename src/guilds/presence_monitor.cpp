#include "ost/guilds/presence_monitor.hpp"

#include <exception>

namespace ost::guilds {

presence_monitor::presence_monitor(guild_registry& registry,
                                   presence_query& presence,
                                   const cancel_token& shutdown,
                                   std::chrono::milliseconds interval,
                                   log_fn log)
    : m_registry(registry)
    , m_presence(presence)
    , m_shutdown(shutdown)
    , m_interval(interval)
    , m_log(std::move(log))
{
}

presence_monitor::~presence_monitor()
{
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void presence_monitor::start()
{
    if (m_thread.joinable()) {
        return;
    }
    m_thread = std::thread(&presence_monitor::run, this);
}

void presence_monitor::run()
{
    m_log(dpp::ll_debug, "Presence monitor started");
    while (!m_shutdown.wait_for(m_interval)) {
        check_once();
    }
    m_log(dpp::ll_debug, "Presence monitor stopped");
}

std::size_t presence_monitor::check_once()
{
    std::size_t stopped = 0;
    for (const auto& player : m_registry.players()) {
        auto channel = player->voice_channel();
        if (!channel) {
            continue;
        }

        try {
            if (m_presence.occupancy(player->guild_id(), *channel) <= 1) {
                m_log(dpp::ll_info, "Leaving voice in guild " + player->guild_id().str() + ": no listeners left");
                player->stop();
                ++stopped;
            }
        } catch (const std::exception& e) {
            m_log(dpp::ll_warning,
                  "Presence check failed for guild " + player->guild_id().str() + ": " + e.what());
        }
    }
    return stopped;
}

} // namespace ost::guilds
