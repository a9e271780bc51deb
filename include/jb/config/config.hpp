#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace jb {

struct bot_config {
    std::string discord_token;

    std::string youtube_key;
    std::string spotify_client_id;
    std::string spotify_client_secret;

    std::chrono::milliseconds resolve_timeout{ 8000 };
    std::chrono::milliseconds locate_timeout{ 20000 };
    std::chrono::seconds      pause_timeout{ 300 };
    std::chrono::seconds      idle_timeout{ 300 };
    int                       reconnect_attempts = 3;
    std::chrono::milliseconds reconnect_base_delay{ 1000 };
    std::size_t               max_playlist_tracks = 25;

    std::string ffmpeg_executable = "ffmpeg";
    std::string ytdlp_executable  = "yt-dlp";
};

struct config_result {
    bot_config               config;
    std::vector<std::string> errors;

    bool ok() const { return errors.empty(); }
};

// Returns nullptr for unset variables.
using env_lookup = std::function<const char*(const char*)>;

config_result load_config(const env_lookup& env);

/// load_config over std::getenv.
config_result load_config_from_env();

} // namespace jb
