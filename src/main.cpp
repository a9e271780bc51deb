#include <dpp/dpp.h>                // D++

#include <chrono>                   // Time
#include <iostream>                 // std::cerr
#include <memory>                   // std::shared_ptr
#include <sstream>                  // std::ostringstream

#include "jb/config/config.hpp"            // Environment config
#include "jb/net/http_client.hpp"          // Provider HTTP over the cluster
#include "jb/providers/youtube.hpp"        // YouTube Data API
#include "jb/providers/spotify.hpp"        // Spotify Web API
#include "jb/resolve/track_resolver.hpp"   // Reference -> tracks
#include "jb/resolve/media_locator.hpp"    // yt-dlp
#include "jb/audio/audio_pipeline.hpp"     // ffmpeg
#include "jb/voice/voice_transport.hpp"    // D++ voice
#include "jb/player/session_registry.hpp"  // Per-guild engines
#include "jb/commands/music.hpp"           // Slash commands

using namespace dpp;

int main() {
    const auto loaded = jb::load_config_from_env();
    if (!loaded.ok()) {
        for (const auto& e : loaded.errors) {
            std::cerr << "Config error: " << e << std::endl;
        }
        return 1;
    }
    const jb::bot_config& cfg = loaded.config;

    cluster bot(cfg.discord_token, i_default_intents | i_guild_voice_states);
    bot.on_log(utility::cout_logger()); // D++ logger

    const jb::log_sink log = [&bot](loglevel level, const std::string& msg) {
        bot.log(level, msg);
    };

    // ---------- Track resolution ----------
    jb::net::dpp_http_client http(bot);

    auto youtube = std::make_shared<jb::providers::youtube_provider>(
        http, cfg.youtube_key, cfg.resolve_timeout, log);
    auto spotify = std::make_shared<jb::providers::spotify_provider>(
        http, cfg.spotify_client_id, cfg.spotify_client_secret,
        cfg.max_playlist_tracks, cfg.resolve_timeout, log);

    if (cfg.youtube_key.empty()) {
        bot.log(ll_warning, "YOUTUBE_KEY not set: search is disabled, YouTube links only");
    }

    jb::resolve::track_resolver resolver({ youtube, spotify }, log);

    // ---------- Playback ----------
    jb::audio::pipeline_options pipe_opts;
    pipe_opts.command = jb::audio::default_ffmpeg_command(cfg.ffmpeg_executable);

    jb::commands::announcer announce(bot);

    jb::player::registry_deps deps;
    deps.locator    = std::make_shared<jb::resolve::ytdlp_media_locator>(cfg.ytdlp_executable, cfg.locate_timeout, log);
    deps.transcoder = std::make_shared<jb::audio::ffmpeg_transcoder>(pipe_opts, log);
    deps.transports = [&bot](snowflake guild_id) -> std::unique_ptr<jb::voice::voice_transport> {
        return std::make_unique<jb::voice::dpp_voice_transport>(bot, guild_id, std::chrono::seconds(10));
    };
    deps.events = [&announce](const jb::playback_event& ev) { announce(ev); };
    deps.log    = log;

    jb::player::engine_config engine_cfg;
    engine_cfg.pause_timeout        = cfg.pause_timeout;
    engine_cfg.reconnect_attempts   = cfg.reconnect_attempts;
    engine_cfg.reconnect_base_delay = cfg.reconnect_base_delay;

    jb::player::session_registry sessions(std::move(deps), engine_cfg);
    jb::commands::music_controller music(bot, resolver, sessions, announce);

    // ---------- Voice glue ----------
    bot.on_voice_state_update([&bot, &sessions](const voice_state_update_t& ev) {
        // Only our own bot's state matters
        if (ev.state.user_id != bot.me.id || ev.state.guild_id.empty()) {
            return;
        }
        if (ev.state.channel_id.empty() && sessions.channel_of(ev.state.guild_id)) {
            bot.log(ll_info, "Dropped from voice in guild " + ev.state.guild_id.str());
            sessions.notify_transport_lost(ev.state.guild_id);
        }
    });

    // ---------- Idle sessions ----------
    bot.start_timer([&bot, &sessions, &announce, &cfg](timer t) {
        (void)t;
        const auto dropped = sessions.reap(std::chrono::steady_clock::now(), cfg.idle_timeout);
        for (const auto& guild : dropped) {
            announce.unbind(guild);
        }
        if (!dropped.empty()) {
            std::ostringstream oss;
            oss << "Reaped " << dropped.size() << " session(s), " << sessions.size() << " active";
            bot.log(ll_info, oss.str());
        }
    }, 30);

    // ---------- Slash command handler ----------
    bot.on_slashcommand([&music](const slashcommand_t& event) {
        music.route_slashcommand(event);
    });

    // ---------- on_ready ----------
    bot.on_ready([&bot](const ready_t& event) {
        (void)event;

        bot.log(ll_info, "Logged in as " + bot.me.username);

        if (run_once<struct register_bot_commands>()) {
            bot.log(ll_info, "Registering slash commands...");
            bot.global_bulk_command_create(jb::commands::make_commands(bot), utility::log_error());
        }
    });

    // ---------- Start bot ----------
    bot.start(dpp::st_wait);
    return 0;
}
