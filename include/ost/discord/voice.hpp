#pragma once

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>

#include <dpp/dpp.h>

#include "ost/guilds/presence_monitor.hpp"
#include "ost/voice/transport.hpp"

namespace ost::discord {

// Voice sessions on D++'s own voice client. main.cpp must forward
// on_voice_ready to handle_voice_ready().
class dpp_voice_transport : public voice::voice_transport {
public:
    explicit dpp_voice_transport(dpp::cluster& cluster,
                                 std::chrono::seconds connect_timeout = std::chrono::seconds(10));

    voice::open_result open(dpp::snowflake guild_id, dpp::snowflake channel_id) override;

    void handle_voice_ready(const dpp::voice_ready_t& ev);

private:
    dpp::cluster&        m_cluster;
    std::chrono::seconds m_connect_timeout;

    std::mutex m_pending_mutex;
    std::map<dpp::snowflake, std::shared_ptr<std::promise<void>>> m_pending;
};

// Counts voice states in the D++ guild cache.
class dpp_presence_query : public guilds::presence_query {
public:
    std::size_t occupancy(dpp::snowflake guild_id, dpp::snowflake channel_id) override;
};

} // namespace ost::discord
