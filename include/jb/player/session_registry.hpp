#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "jb/player/playback_engine.hpp"

namespace jb::player {

struct registry_deps {
    std::shared_ptr<resolve::media_locator> locator;
    std::shared_ptr<audio::transcoder>      transcoder;
    voice::transport_factory                transports;
    // Events for a session, given its guild. Called on that session's thread.
    event_sink                              events;
    log_sink                                log;
};

/// One playback engine per guild the bot is in a voice channel of.
class session_registry {
public:
    session_registry(registry_deps deps, engine_config cfg = {});
    ~session_registry();

    session_registry(const session_registry&)            = delete;
    session_registry& operator=(const session_registry&) = delete;

    /// Create the guild's session and connect it. Joining the channel the
    /// session already uses is a no-op; another channel is invalid_state.
    command_result join(const voice_channel& channel);

    /// Stop the session and forget it.
    command_result stop_and_leave(dpp::snowflake guild_id);

    command_result enqueue(dpp::snowflake guild_id, std::vector<resolved_track> tracks);
    command_result skip(dpp::snowflake guild_id);
    command_result pause(dpp::snowflake guild_id);
    command_result resume(dpp::snowflake guild_id);
    command_result remove(dpp::snowflake guild_id, std::uint64_t entry_id);
    command_result move(dpp::snowflake guild_id, std::uint64_t entry_id, std::size_t position);
    std::optional<queue_snapshot> list_queue(dpp::snowflake guild_id);

    /// Voice channel of the guild's live session.
    std::optional<voice_channel> channel_of(dpp::snowflake guild_id);

    void notify_transport_lost(dpp::snowflake guild_id);

    /// Drop sessions whose loop has ended and sessions idle for longer than
    /// idle_timeout. Returns the guilds dropped.
    std::vector<dpp::snowflake> reap(std::chrono::steady_clock::time_point now,
                                     std::chrono::milliseconds idle_timeout);

    std::size_t size() const;

private:
    using engine_ptr = std::shared_ptr<playback_engine>;

    engine_ptr find(dpp::snowflake guild_id) const;
    command_result with_session(dpp::snowflake guild_id,
                                const std::function<command_result(playback_engine&)>& fn);

    registry_deps       m_deps;
    const engine_config m_cfg;

    mutable std::mutex                   m_mutex;
    std::map<dpp::snowflake, engine_ptr> m_sessions;
};

} // namespace jb::player
