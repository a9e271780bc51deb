#include "jb/voice/voice_transport.hpp"

#include <sstream>
#include <thread>

namespace jb::voice {

dpp_voice_transport::dpp_voice_transport(dpp::cluster& cluster,
                                         dpp::snowflake guild_id,
                                         std::chrono::milliseconds connect_timeout)
    : m_cluster(cluster)
    , m_guild_id(guild_id)
    , m_connect_timeout(connect_timeout)
{
}

dpp_voice_transport::~dpp_voice_transport()
{
    if (m_open) {
        close();
    }
}

dpp::discord_client* dpp_voice_transport::shard() const
{
    dpp::guild* g = dpp::find_guild(m_guild_id);
    if (!g) {
        return nullptr;
    }
    return m_cluster.get_shard(g->shard_id);
}

transport_status dpp_voice_transport::open(const voice_channel& channel)
{
    dpp::discord_client* s = shard();
    if (!s) {
        m_cluster.log(dpp::ll_warning, "No shard for guild " + m_guild_id.str());
        return transport_status::disconnected;
    }

    {
        std::ostringstream oss;
        oss << "Connecting voice for guild " << m_guild_id
            << " channel " << channel.channel_id;
        m_cluster.log(dpp::ll_info, oss.str());
    }

    try {
        // Drop a half-dead connection left over from a previous attempt.
        if (s->get_voice(m_guild_id)) {
            s->disconnect_voice(m_guild_id);
        }
        s->connect_voice(m_guild_id, channel.channel_id, false, true);
    } catch (const std::exception& e) {
        m_cluster.log(dpp::ll_warning, std::string("connect_voice failed: ") + e.what());
        return transport_status::disconnected;
    }
    m_open = true;

    const auto deadline = std::chrono::steady_clock::now() + m_connect_timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        dpp::voiceconn* vc = s->get_voice(m_guild_id);
        if (vc && vc->is_ready()) {
            m_cluster.log(dpp::ll_info, "Voice ready for guild " + m_guild_id.str());
            return transport_status::ok;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    m_cluster.log(dpp::ll_warning, "Voice connection timed out for guild " + m_guild_id.str());
    return transport_status::disconnected;
}

transport_status dpp_voice_transport::send_frame(const audio_frame& frame)
{
    dpp::discord_client* s = shard();
    if (!s) {
        return transport_status::disconnected;
    }

    dpp::voiceconn* vc = s->get_voice(m_guild_id);
    if (!vc || !vc->voiceclient || !vc->voiceclient->is_ready() || vc->voiceclient->terminating) {
        return transport_status::disconnected;
    }

    try {
        // send_audio_raw takes a mutable pointer but only reads it.
        auto* samples = reinterpret_cast<std::uint16_t*>(const_cast<std::uint8_t*>(frame.payload.data()));
        vc->voiceclient->send_audio_raw(samples, frame.payload.size());
    } catch (const std::exception& e) {
        m_cluster.log(dpp::ll_warning,
                      "send_audio_raw failed for guild " + m_guild_id.str() + ": " + e.what());
        return transport_status::send_failed;
    }
    return transport_status::ok;
}

void dpp_voice_transport::close()
{
    m_open = false;

    dpp::discord_client* s = shard();
    if (!s) {
        return;
    }
    try {
        if (dpp::voiceconn* vc = s->get_voice(m_guild_id); vc && vc->voiceclient) {
            vc->voiceclient->stop_audio();
        }
        s->disconnect_voice(m_guild_id);
    } catch (const std::exception& e) {
        m_cluster.log(dpp::ll_warning, std::string("disconnect_voice failed: ") + e.what());
    }
    m_cluster.log(dpp::ll_info, "Voice closed for guild " + m_guild_id.str());
}

} // namespace jb::voice
