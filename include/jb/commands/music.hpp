#pragma once

#include <dpp/dpp.h>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "jb/player/session_registry.hpp"
#include "jb/resolve/track_resolver.hpp"

namespace jb::commands {

/// Build the music slash commands (/join, /play, /skip, /pause, /resume,
/// /stop, /queue, /nowplaying, /remove, /move).
std::vector<dpp::slashcommand> make_commands(dpp::cluster& bot);

/// Posts engine events to the text channel each session was started from.
class announcer {
public:
    explicit announcer(dpp::cluster& bot);

    void bind(dpp::snowflake guild_id, dpp::snowflake text_channel);
    void unbind(dpp::snowflake guild_id);

    /// Event sink for the session registry.
    void operator()(const playback_event& ev);

private:
    dpp::cluster&                            m_bot;
    std::mutex                               m_mutex;
    std::map<dpp::snowflake, dpp::snowflake> m_channels;
};

class music_controller {
public:
    music_controller(dpp::cluster& bot,
                     resolve::track_resolver& resolver,
                     player::session_registry& sessions,
                     announcer& announce);

    /// Handle a music command. Returns false for commands that are not ours.
    bool route_slashcommand(const dpp::slashcommand_t& ev);

private:
    void handle_join(const dpp::slashcommand_t& ev, const voice_channel& vc);
    void handle_play(const dpp::slashcommand_t& ev, const voice_channel& vc, const std::string& query);
    void handle_stop(const dpp::slashcommand_t& ev);
    void handle_queue(const dpp::slashcommand_t& ev);
    void handle_now_playing(const dpp::slashcommand_t& ev);
    void handle_remove(const dpp::slashcommand_t& ev, std::int64_t id);
    void handle_move(const dpp::slashcommand_t& ev, std::int64_t id, std::int64_t position);

    // Create the session unless the guild already has one in this channel.
    command_result ensure_session(const dpp::slashcommand_t& ev, const voice_channel& vc);

    dpp::cluster&             m_bot;
    resolve::track_resolver&  m_resolver;
    player::session_registry& m_sessions;
    announcer&                m_announce;
};

/// Voice channel the user is connected to in that guild, from the cache.
std::optional<voice_channel> user_voice_channel(dpp::snowflake guild_id, dpp::snowflake user_id);

// ---------- Message text ----------

/// "Title - Artist [MM:SS]" with a link when there is one.
std::string describe_track(const resolved_track& t);

/// Chat text for an engine event, or nullopt for events that stay silent.
std::optional<std::string> describe_event(const playback_event& ev);

/// Now playing plus the first max_entries upcoming entries.
std::string format_queue(const player::queue_snapshot& s, std::size_t max_entries = 10);

std::string format_now_playing(const player::queue_snapshot& s);

/// Reply text for an enqueue of the given tracks.
std::string format_enqueued(const std::vector<resolved_track>& tracks, const command_result& r);

} // namespace jb::commands
