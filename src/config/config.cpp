#include "jb/config/config.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace jb {

namespace {

void read_string(const env_lookup& env, const char* name, std::string& out)
{
    if (const char* v = env(name)) {
        out = v;
    }
}

// Non-negative integer in [min, max]; anything else is reported.
bool read_number(const env_lookup& env, const char* name, long long min, long long max,
                 long long& out, std::vector<std::string>& errors)
{
    const char* v = env(name);
    if (!v || *v == '\0') {
        return false;
    }

    const std::string text(v);
    std::size_t       used = 0;
    long long         n    = 0;
    try {
        n = std::stoll(text, &used);
    } catch (const std::exception&) {
        errors.push_back(std::string(name) + " is not a number: '" + text + "'");
        return false;
    }
    if (used != text.size()) {
        errors.push_back(std::string(name) + " is not a number: '" + text + "'");
        return false;
    }
    if (n < min || n > max) {
        errors.push_back(std::string(name) + " must be between " + std::to_string(min) +
                         " and " + std::to_string(max));
        return false;
    }
    out = n;
    return true;
}

template <typename Duration>
void read_duration(const env_lookup& env, const char* name, Duration& out, std::vector<std::string>& errors)
{
    long long n = 0;
    if (read_number(env, name, 1, std::numeric_limits<int>::max(), n, errors)) {
        out = Duration(n);
    }
}

} // namespace

config_result load_config(const env_lookup& env)
{
    config_result res;
    bot_config&   cfg = res.config;

    read_string(env, "DISCORD_TOKEN", cfg.discord_token);
    if (cfg.discord_token.empty()) {
        res.errors.emplace_back("DISCORD_TOKEN is not set");
    }

    read_string(env, "YOUTUBE_KEY", cfg.youtube_key);
    read_string(env, "SPOTIFY_CLIENT_ID", cfg.spotify_client_id);
    read_string(env, "SPOTIFY_CLIENT_SECRET", cfg.spotify_client_secret);

    read_duration(env, "JB_RESOLVE_TIMEOUT_MS", cfg.resolve_timeout, res.errors);
    read_duration(env, "JB_LOCATE_TIMEOUT_MS", cfg.locate_timeout, res.errors);
    read_duration(env, "JB_PAUSE_TIMEOUT_S", cfg.pause_timeout, res.errors);
    read_duration(env, "JB_IDLE_TIMEOUT_S", cfg.idle_timeout, res.errors);
    read_duration(env, "JB_RECONNECT_BASE_MS", cfg.reconnect_base_delay, res.errors);

    long long n = 0;
    if (read_number(env, "JB_RECONNECT_ATTEMPTS", 1, 20, n, res.errors)) {
        cfg.reconnect_attempts = static_cast<int>(n);
    }
    if (read_number(env, "JB_MAX_PLAYLIST_TRACKS", 1, 100, n, res.errors)) {
        cfg.max_playlist_tracks = static_cast<std::size_t>(n);
    }

    read_string(env, "JB_FFMPEG", cfg.ffmpeg_executable);
    read_string(env, "JB_YTDLP", cfg.ytdlp_executable);

    if (cfg.spotify_client_id.empty() != cfg.spotify_client_secret.empty()) {
        res.errors.emplace_back("SPOTIFY_CLIENT_ID and SPOTIFY_CLIENT_SECRET must be set together");
    }
    return res;
}

config_result load_config_from_env()
{
    return load_config([](const char* name) -> const char* { return std::getenv(name); });
}

} // namespace jb
