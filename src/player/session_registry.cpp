#include "jb/player/session_registry.hpp"

#include <sstream>

namespace jb::player {

session_registry::session_registry(registry_deps deps, engine_config cfg)
    : m_deps(std::move(deps))
    , m_cfg(cfg)
{
    if (!m_deps.log) {
        m_deps.log = [](dpp::loglevel, const std::string&) {};
    }
}

session_registry::~session_registry()
{
    std::map<dpp::snowflake, engine_ptr> sessions;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        sessions.swap(m_sessions);
    }
    // Engines stop and join their threads as they are released.
    sessions.clear();
}

session_registry::engine_ptr session_registry::find(dpp::snowflake guild_id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(guild_id);
    if (it == m_sessions.end() || it->second->terminated()) {
        return nullptr;
    }
    return it->second;
}

command_result session_registry::with_session(dpp::snowflake guild_id,
                                              const std::function<command_result(playback_engine&)>& fn)
{
    engine_ptr engine = find(guild_id);
    if (!engine) {
        return command_result::failure(error_code::session_not_found);
    }
    return fn(*engine);
}

command_result session_registry::join(const voice_channel& channel)
{
    engine_ptr engine;
    engine_ptr stale;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(channel.guild_id);
        if (it != m_sessions.end()) {
            if (!it->second->terminated()) {
                if (it->second->channel().channel_id == channel.channel_id) {
                    return command_result::success();
                }
                return command_result::failure(error_code::invalid_state,
                                               "Already playing in another voice channel");
            }
            stale = std::move(it->second);
            m_sessions.erase(it);
        }

        engine_deps deps;
        deps.locator    = m_deps.locator;
        deps.transcoder = m_deps.transcoder;
        deps.transport  = m_deps.transports(channel.guild_id);
        deps.events     = m_deps.events;
        deps.log        = m_deps.log;
        if (!deps.transport) {
            return command_result::failure(error_code::transport_disconnected, "No voice connection available");
        }

        engine = std::make_shared<playback_engine>(channel.guild_id, channel, std::move(deps), m_cfg);
        m_sessions[channel.guild_id] = engine;
    }
    stale.reset();

    // Connecting can take seconds; other guilds must not wait on it.
    command_result r = engine->open();
    if (!r.ok()) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_sessions.find(channel.guild_id);
            if (it != m_sessions.end() && it->second == engine) {
                m_sessions.erase(it);
            }
        }
        static_cast<void>(engine->stop()); // closes the half-open transport
        m_deps.log(dpp::ll_warning, "Join failed for guild " + channel.guild_id.str() + ": " + r.message);
        return r;
    }

    std::ostringstream oss;
    oss << "Session created for guild " << channel.guild_id << " in channel " << channel.channel_id;
    m_deps.log(dpp::ll_info, oss.str());
    return r;
}

command_result session_registry::stop_and_leave(dpp::snowflake guild_id)
{
    engine_ptr engine;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(guild_id);
        if (it == m_sessions.end()) {
            return command_result::failure(error_code::session_not_found);
        }
        engine = std::move(it->second);
        m_sessions.erase(it);
    }

    if (engine->terminated()) {
        return command_result::success();
    }
    command_result r = engine->stop();
    // The loop may have ended on its own between the check and the stop.
    if (r.code == error_code::session_not_found) {
        return command_result::success();
    }
    return r;
}

command_result session_registry::enqueue(dpp::snowflake guild_id, std::vector<resolved_track> tracks)
{
    return with_session(guild_id, [&tracks](playback_engine& e) { return e.enqueue(std::move(tracks)); });
}

command_result session_registry::skip(dpp::snowflake guild_id)
{
    return with_session(guild_id, [](playback_engine& e) { return e.skip(); });
}

command_result session_registry::pause(dpp::snowflake guild_id)
{
    return with_session(guild_id, [](playback_engine& e) { return e.pause(); });
}

command_result session_registry::resume(dpp::snowflake guild_id)
{
    return with_session(guild_id, [](playback_engine& e) { return e.resume(); });
}

command_result session_registry::remove(dpp::snowflake guild_id, std::uint64_t entry_id)
{
    return with_session(guild_id, [entry_id](playback_engine& e) { return e.remove(entry_id); });
}

command_result session_registry::move(dpp::snowflake guild_id, std::uint64_t entry_id, std::size_t position)
{
    return with_session(guild_id, [entry_id, position](playback_engine& e) { return e.move(entry_id, position); });
}

std::optional<queue_snapshot> session_registry::list_queue(dpp::snowflake guild_id)
{
    engine_ptr engine = find(guild_id);
    if (!engine) {
        return std::nullopt;
    }
    return engine->list_queue();
}

std::optional<voice_channel> session_registry::channel_of(dpp::snowflake guild_id)
{
    engine_ptr engine = find(guild_id);
    if (!engine) {
        return std::nullopt;
    }
    return engine->channel();
}

void session_registry::notify_transport_lost(dpp::snowflake guild_id)
{
    if (engine_ptr engine = find(guild_id)) {
        engine->notify_transport_lost();
    }
}

std::vector<dpp::snowflake> session_registry::reap(std::chrono::steady_clock::time_point now,
                                                   std::chrono::milliseconds idle_timeout)
{
    std::vector<engine_ptr>     dropped;
    std::vector<dpp::snowflake> guilds;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_sessions.begin(); it != m_sessions.end();) {
            const auto idle   = it->second->idle_since();
            const bool expire = it->second->terminated() || (idle && now - *idle >= idle_timeout);
            if (expire) {
                guilds.push_back(it->first);
                dropped.push_back(std::move(it->second));
                it = m_sessions.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& e : dropped) {
        if (!e->terminated()) {
            m_deps.log(dpp::ll_info, "Leaving idle session in guild " + e->session_id().str());
            const auto r = e->stop();
            if (!r.ok()) {
                m_deps.log(dpp::ll_debug, "Idle session already stopping: " + r.message);
            }
        }
    }
    return guilds;
}

std::size_t session_registry::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.size();
}

} // namespace jb::player
