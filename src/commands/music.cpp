#include "jb/commands/music.hpp"

#include <algorithm>
#include <sstream>
#include <thread>

namespace jb::commands {

namespace {

const char* const same_channel_text = "You must be in the same voice channel as me";
const char* const no_voice_text     = "Must be in a voice channel";

void reply(const dpp::slashcommand_t& ev, const std::string& text)
{
    ev.edit_original_response(dpp::message(text));
}

std::string error_text(const command_result& r)
{
    return r.message.empty() ? std::string(to_string(r.code)) : r.message;
}

} // namespace

// ---------- Command table ----------

std::vector<dpp::slashcommand> make_commands(dpp::cluster& bot)
{
    dpp::slashcommand join("join", "Join your voice channel", bot.me.id);

    dpp::slashcommand play("play", "Play a song or add it to the queue", bot.me.id);
    play.add_option(
        dpp::command_option(dpp::co_string, "query", "YouTube or Spotify link, or search text", true)
    );

    dpp::slashcommand skip("skip", "Skip the current song", bot.me.id);
    dpp::slashcommand pause("pause", "Pause playback", bot.me.id);
    dpp::slashcommand resume("resume", "Resume playback", bot.me.id);
    dpp::slashcommand stop("stop", "Stop, clear the queue and leave", bot.me.id);
    dpp::slashcommand queue("queue", "Show the queue", bot.me.id);
    dpp::slashcommand nowplaying("nowplaying", "Show the current song", bot.me.id);

    dpp::slashcommand remove("remove", "Remove a song from the queue", bot.me.id);
    remove.add_option(
        dpp::command_option(dpp::co_integer, "id", "Entry id shown by /queue", true)
    );

    dpp::slashcommand move("move", "Move a queued song", bot.me.id);
    move.add_option(
        dpp::command_option(dpp::co_integer, "id", "Entry id shown by /queue", true)
    );
    move.add_option(
        dpp::command_option(dpp::co_integer, "position", "New place in the queue, 1 is next", true)
    );

    return { join, play, skip, pause, resume, stop, queue, nowplaying, remove, move };
}

// ---------- Announcer ----------

announcer::announcer(dpp::cluster& bot)
    : m_bot(bot)
{
}

void announcer::bind(dpp::snowflake guild_id, dpp::snowflake text_channel)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_channels[guild_id] = text_channel;
}

void announcer::unbind(dpp::snowflake guild_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_channels.erase(guild_id);
}

void announcer::operator()(const playback_event& ev)
{
    const auto text = describe_event(ev);
    if (!text) {
        return;
    }

    dpp::snowflake channel;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_channels.find(ev.session_id);
        if (it == m_channels.end()) {
            return;
        }
        channel = it->second;
    }
    m_bot.message_create(dpp::message(channel, *text), dpp::utility::log_error());
}

// ---------- Controller ----------

music_controller::music_controller(dpp::cluster& bot,
                                   resolve::track_resolver& resolver,
                                   player::session_registry& sessions,
                                   announcer& announce)
    : m_bot(bot)
    , m_resolver(resolver)
    , m_sessions(sessions)
    , m_announce(announce)
{
}

std::optional<voice_channel> user_voice_channel(dpp::snowflake guild_id, dpp::snowflake user_id)
{
    dpp::guild* g = dpp::find_guild(guild_id);
    if (!g) {
        return std::nullopt;
    }
    auto it = g->voice_members.find(user_id);
    if (it == g->voice_members.end() || it->second.channel_id.empty()) {
        return std::nullopt;
    }
    return voice_channel{ guild_id, it->second.channel_id };
}

bool music_controller::route_slashcommand(const dpp::slashcommand_t& ev)
{
    const std::string name  = ev.command.get_command_name();
    const dpp::snowflake guild = ev.command.guild_id;

    static const char* const ours[] = { "join", "play", "skip", "pause", "resume", "stop",
                                        "queue", "nowplaying", "remove", "move" };
    bool known = false;
    for (const char* n : ours) {
        known = known || name == n;
    }
    if (!known) {
        return false;
    }

    ev.thinking(false);

    {
        std::ostringstream oss;
        oss << "/" << name << " from " << ev.command.get_issuing_user().id << " in guild " << guild;
        m_bot.log(dpp::ll_debug, oss.str());
    }

    // Read the voice cache here, the handlers below may run on another thread.
    const auto vc = user_voice_channel(guild, ev.command.get_issuing_user().id);

    if (name == "join" || name == "play") {
        if (!vc) {
            reply(ev, no_voice_text);
            return true;
        }
        if (name == "join") {
            std::thread([this, ev, vc = *vc] { handle_join(ev, vc); }).detach();
            return true;
        }
        const std::string query = std::get<std::string>(ev.get_parameter("query"));
        // Resolution and voice connect can take seconds.
        std::thread([this, ev, vc = *vc, query] { handle_play(ev, vc, query); }).detach();
        return true;
    }

    if (name == "skip") {
        const auto r = m_sessions.skip(guild);
        reply(ev, r.ok() ? "Skipped" : error_text(r));
    } else if (name == "pause") {
        const auto r = m_sessions.pause(guild);
        reply(ev, r.ok() ? "Paused" : error_text(r));
    } else if (name == "resume") {
        const auto r = m_sessions.resume(guild);
        reply(ev, r.ok() ? "Resumed" : error_text(r));
    } else if (name == "stop") {
        std::thread([this, ev] { handle_stop(ev); }).detach();
    } else if (name == "queue") {
        handle_queue(ev);
    } else if (name == "nowplaying") {
        handle_now_playing(ev);
    } else if (name == "remove") {
        handle_remove(ev, std::get<std::int64_t>(ev.get_parameter("id")));
    } else if (name == "move") {
        handle_move(ev,
                    std::get<std::int64_t>(ev.get_parameter("id")),
                    std::get<std::int64_t>(ev.get_parameter("position")));
    }
    return true;
}

command_result music_controller::ensure_session(const dpp::slashcommand_t& ev, const voice_channel& vc)
{
    if (const auto current = m_sessions.channel_of(vc.guild_id)) {
        if (current->channel_id != vc.channel_id) {
            return command_result::failure(error_code::invalid_state, same_channel_text);
        }
        return command_result::success();
    }

    m_announce.bind(vc.guild_id, ev.command.channel_id);
    auto r = m_sessions.join(vc);
    if (!r.ok()) {
        m_announce.unbind(vc.guild_id);
    }
    return r;
}

void music_controller::handle_join(const dpp::slashcommand_t& ev, const voice_channel& vc)
{
    const auto r = ensure_session(ev, vc);
    if (!r.ok()) {
        reply(ev, error_text(r));
        return;
    }
    reply(ev, "Joined <#" + vc.channel_id.str() + ">");
}

void music_controller::handle_play(const dpp::slashcommand_t& ev, const voice_channel& vc, const std::string& query)
{
    const auto reference = track_reference::from_user_input(query);
    auto       resolved  = m_resolver.resolve(reference, ev.command.get_issuing_user().id);
    if (!resolved.ok()) {
        std::ostringstream oss;
        oss << "Could not resolve '" << query << "': " << to_string(resolved.code);
        if (!resolved.error_message.empty()) {
            oss << " (" << resolved.error_message << ")";
        }
        m_bot.log(dpp::ll_info, oss.str());
        reply(ev, to_string(resolved.code));
        return;
    }

    const auto joined = ensure_session(ev, vc);
    if (!joined.ok()) {
        reply(ev, error_text(joined));
        return;
    }

    const auto tracks = resolved.tracks;
    const auto r      = m_sessions.enqueue(vc.guild_id, std::move(resolved.tracks));
    reply(ev, format_enqueued(tracks, r));
}

void music_controller::handle_stop(const dpp::slashcommand_t& ev)
{
    const auto r = m_sessions.stop_and_leave(ev.command.guild_id);
    m_announce.unbind(ev.command.guild_id);
    reply(ev, r.ok() ? "Stopped and left the channel" : error_text(r));
}

void music_controller::handle_queue(const dpp::slashcommand_t& ev)
{
    const auto s = m_sessions.list_queue(ev.command.guild_id);
    if (!s) {
        reply(ev, to_string(error_code::session_not_found));
        return;
    }
    reply(ev, format_queue(*s));
}

void music_controller::handle_now_playing(const dpp::slashcommand_t& ev)
{
    const auto s = m_sessions.list_queue(ev.command.guild_id);
    if (!s) {
        reply(ev, to_string(error_code::session_not_found));
        return;
    }
    reply(ev, format_now_playing(*s));
}

void music_controller::handle_remove(const dpp::slashcommand_t& ev, std::int64_t id)
{
    if (id < 1) {
        reply(ev, to_string(error_code::entry_not_found));
        return;
    }
    const auto r = m_sessions.remove(ev.command.guild_id, static_cast<std::uint64_t>(id));
    reply(ev, r.ok() ? "Removed #" + std::to_string(id) : error_text(r));
}

void music_controller::handle_move(const dpp::slashcommand_t& ev, std::int64_t id, std::int64_t position)
{
    if (id < 1) {
        reply(ev, to_string(error_code::entry_not_found));
        return;
    }
    if (position < 1) {
        reply(ev, "Position starts at 1");
        return;
    }
    const auto r = m_sessions.move(ev.command.guild_id,
                                   static_cast<std::uint64_t>(id),
                                   static_cast<std::size_t>(position - 1));
    reply(ev, r.ok() ? "Moved #" + std::to_string(id) + " to position " + std::to_string(position)
                     : error_text(r));
}

// ---------- Message text ----------

std::string describe_track(const resolved_track& t)
{
    std::ostringstream oss;
    oss << "**" << t.title << "**";
    if (!t.artist.empty()) {
        oss << " - " << t.artist;
    }
    if (t.duration) {
        oss << " [" << format_duration(*t.duration) << "]";
    }
    if (!t.url.empty()) {
        oss << " <" << t.url << ">";
    }
    return oss.str();
}

std::optional<std::string> describe_event(const playback_event& ev)
{
    switch (ev.type) {
    case event_type::track_started:
        if (ev.entry) {
            return "Playing " + describe_track(ev.entry->track);
        }
        return std::nullopt;
    case event_type::track_ended:
        // Failures are announced through the matching error event.
        return std::nullopt;
    case event_type::queue_empty:
        return std::string("Queue finished");
    case event_type::error: {
        std::ostringstream oss;
        if (ev.entry) {
            oss << "Skipped **" << ev.entry->track.title << "**: " << to_string(ev.error);
        } else {
            oss << to_string(ev.error);
            if (!ev.message.empty()) {
                oss << ": " << ev.message;
            }
        }
        return oss.str();
    }
    }
    return std::nullopt;
}

std::string format_now_playing(const player::queue_snapshot& s)
{
    if (!s.current) {
        return "Nothing playing";
    }

    const auto& t = s.current->entry.track;
    std::ostringstream oss;
    oss << (s.mode == session_mode::paused ? "Paused: " : "Now playing: ") << describe_track(t) << "\n"
        << format_duration(s.position);
    if (t.duration) {
        oss << " / " << format_duration(*t.duration);
    }
    if (!t.requested_by.empty()) {
        oss << " - requested by <@" << t.requested_by << ">";
    }
    return oss.str();
}

std::string format_queue(const player::queue_snapshot& s, std::size_t max_entries)
{
    std::ostringstream oss;
    oss << format_now_playing(s);

    if (s.upcoming.empty()) {
        oss << "\nThe queue is empty";
        return oss.str();
    }

    oss << "\n\nUp next:";
    const std::size_t shown = std::min(max_entries, s.upcoming.size());
    for (std::size_t i = 0; i < shown; ++i) {
        const auto& e = s.upcoming[i];
        oss << "\n" << (i + 1) << ". `#" << e.id << "` " << e.track.title;
        if (e.track.duration) {
            oss << " [" << format_duration(*e.track.duration) << "]";
        }
    }
    if (s.upcoming.size() > shown) {
        oss << "\n...and " << (s.upcoming.size() - shown) << " more";
    }
    return oss.str();
}

std::string format_enqueued(const std::vector<resolved_track>& tracks, const command_result& r)
{
    if (!r.ok()) {
        return error_text(r);
    }
    if (tracks.size() == 1 && r.entry_ids.size() == 1) {
        return "Queued `#" + std::to_string(r.entry_ids.front()) + "` " + describe_track(tracks.front());
    }
    std::ostringstream oss;
    oss << "Queued " << r.entry_ids.size() << " tracks";
    if (!r.entry_ids.empty()) {
        oss << " (`#" << r.entry_ids.front() << "` to `#" << r.entry_ids.back() << "`)";
    }
    return oss.str();
}

} // namespace jb::commands
