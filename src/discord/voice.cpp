#include "ost/discord/voice.hpp"

#include <sstream>

namespace ost::discord {

namespace {

// Looks the voice client up on every call: D++ deletes it when the
// connection drops, so holding the pointer would dangle.
class dpp_voice_session : public voice::voice_session {
public:
    dpp_voice_session(dpp::cluster& cluster, dpp::discord_client* shard,
                      dpp::snowflake guild_id, dpp::snowflake channel_id)
        : m_cluster(cluster)
        , m_shard(shard)
        , m_guild_id(guild_id)
        , m_channel_id(channel_id)
    {
    }

    bool send_frame(const audio::audio_frame& frame) override
    {
        dpp::discord_voice_client* vc = voice_client();
        if (!vc) {
            return false;
        }
        try {
            vc->send_audio_opus(const_cast<uint8_t*>(frame.data()), frame.size());
        } catch (const dpp::exception& e) {
            m_cluster.log(dpp::ll_warning, "Voice send failed in guild " + m_guild_id.str() + ": " + e.what());
            return false;
        }
        return true;
    }

    void discard_pending() override
    {
        if (dpp::discord_voice_client* vc = voice_client()) {
            vc->stop_audio();
        }
    }

    void close() override
    {
        m_shard->disconnect_voice(m_guild_id);
        m_cluster.log(dpp::ll_info, "Left voice channel " + m_channel_id.str() + " in guild " + m_guild_id.str());
    }

    dpp::snowflake channel_id() const override { return m_channel_id; }

private:
    dpp::discord_voice_client* voice_client() const
    {
        dpp::voiceconn* conn = m_shard->get_voice(m_guild_id);
        if (!conn || !conn->voiceclient || !conn->voiceclient->is_ready()) {
            return nullptr;
        }
        return conn->voiceclient;
    }

    dpp::cluster&        m_cluster;
    dpp::discord_client* m_shard;
    dpp::snowflake       m_guild_id;
    dpp::snowflake       m_channel_id;
};

voice::open_result unavailable(const std::string& message)
{
    voice::open_result res;
    res.code          = errc::voice_unavailable;
    res.error_message = message;
    return res;
}

} // namespace

dpp_voice_transport::dpp_voice_transport(dpp::cluster& cluster, std::chrono::seconds connect_timeout)
    : m_cluster(cluster)
    , m_connect_timeout(connect_timeout)
{
}

voice::open_result dpp_voice_transport::open(dpp::snowflake guild_id, dpp::snowflake channel_id)
{
    dpp::guild* g = dpp::find_guild(guild_id);
    if (!g) {
        return unavailable("guild " + guild_id.str() + " is not cached");
    }

    dpp::discord_client* shard = m_cluster.get_shard(g->shard_id);
    if (!shard) {
        return unavailable("no shard for guild " + guild_id.str());
    }

    auto prom = std::make_shared<std::promise<void>>();
    auto fut  = prom->get_future();
    {
        std::lock_guard<std::mutex> lock(m_pending_mutex);
        m_pending[guild_id] = prom;
    }

    std::ostringstream oss;
    oss << "Connecting to voice channel " << channel_id << " in guild " << guild_id;
    m_cluster.log(dpp::ll_info, oss.str());

    shard->connect_voice(guild_id, channel_id, false, true);

    const bool ready = fut.wait_for(m_connect_timeout) == std::future_status::ready;
    {
        std::lock_guard<std::mutex> lock(m_pending_mutex);
        auto it = m_pending.find(guild_id);
        if (it != m_pending.end() && it->second == prom) {
            m_pending.erase(it);
        }
    }

    if (!ready) {
        shard->disconnect_voice(guild_id);
        return unavailable("timed out joining voice channel " + channel_id.str());
    }

    voice::open_result res;
    res.session = std::make_shared<dpp_voice_session>(m_cluster, shard, guild_id, channel_id);
    return res;
}

void dpp_voice_transport::handle_voice_ready(const dpp::voice_ready_t& ev)
{
    if (!ev.voice_client) {
        return;
    }

    std::shared_ptr<std::promise<void>> prom;
    {
        std::lock_guard<std::mutex> lock(m_pending_mutex);
        auto it = m_pending.find(ev.voice_client->server_id);
        if (it == m_pending.end()) {
            return;
        }
        prom = std::move(it->second);
        m_pending.erase(it);
    }
    prom->set_value();
}

std::size_t dpp_presence_query::occupancy(dpp::snowflake guild_id, dpp::snowflake channel_id)
{
    dpp::guild* g = dpp::find_guild(guild_id);
    if (!g) {
        return 0;
    }

    std::size_t count = 0;
    for (const auto& [user_id, state] : g->voice_members) {
        if (state.channel_id == channel_id) {
            ++count;
        }
    }
    return count;
}

} // namespace ost::discord
