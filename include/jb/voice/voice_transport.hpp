#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include <dpp/dpp.h>

#include "jb/core/types.hpp"

namespace jb::voice {

enum class transport_status {
    ok,
    disconnected,
    send_failed
};

/// Outbound audio for one voice session. Owned by that session's engine;
/// only its control loop calls it.
class voice_transport {
public:
    virtual ~voice_transport() = default;

    virtual transport_status open(const voice_channel& channel) = 0;

    /// Hand one frame over. Pacing is the caller's job.
    virtual transport_status send_frame(const audio_frame& frame) = 0;

    virtual void close() = 0;
};

using transport_factory = std::function<std::unique_ptr<voice_transport>(dpp::snowflake guild_id)>;

/// Voice over the DPP shard that owns the guild. DPP Opus-encodes the raw
/// PCM it is given and transmits it as it arrives.
class dpp_voice_transport : public voice_transport {
public:
    dpp_voice_transport(dpp::cluster& cluster,
                        dpp::snowflake guild_id,
                        std::chrono::milliseconds connect_timeout);
    ~dpp_voice_transport() override;

    transport_status open(const voice_channel& channel) override;
    transport_status send_frame(const audio_frame& frame) override;
    void             close() override;

private:
    dpp::discord_client* shard() const;

    dpp::cluster&             m_cluster;
    dpp::snowflake            m_guild_id;
    std::chrono::milliseconds m_connect_timeout;
    bool                      m_open = false;
};

} // namespace jb::voice
