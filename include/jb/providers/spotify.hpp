#pragma once

#include <string>
#include <mutex>
#include <optional>
#include <chrono>
#include <cstddef>

#include "jb/providers/provider.hpp"

namespace jb::providers {

struct spotify_link {
    enum class type { track, playlist, album };

    type        kind = type::track;
    std::string id;
};

/// Parse open.spotify.com/{track,playlist,album}/<22 char id> links.
std::optional<spotify_link> parse_spotify_link(const std::string& url);

/// Spotify Web API, client-credentials flow. Metadata only: its tracks have
/// to be matched to a provider that hosts audio.
class spotify_provider : public provider {
public:
    spotify_provider(net::http_client& http,
                     std::string client_id,
                     std::string client_secret,
                     std::size_t max_playlist_tracks,
                     std::chrono::milliseconds timeout,
                     log_sink log);

    provider_kind kind() const override { return provider_kind::spotify; }
    bool hosts_audio() const override { return false; }
    bool matches(const std::string& url) const override;

    provider_result search(const std::string& query, std::size_t max_results) override;
    provider_result fetch(const std::string& url) override;

private:
    // Bearer token, requested or refreshed when needed. Empty on failure.
    std::string access_token(std::string& error);
    void        invalidate_token();

    // GET with bearer auth, refreshing the token once on 401.
    net::http_response api_get(const std::string& url, std::string& error);

    provider_result fetch_track(const std::string& id);
    provider_result fetch_collection(const spotify_link& link);

    net::http_client&         m_http;
    std::string               m_client_id;
    std::string               m_client_secret;
    std::size_t               m_max_playlist_tracks;
    std::chrono::milliseconds m_timeout;
    log_sink                  m_log;

    std::mutex                            m_token_mutex;
    std::string                           m_token;
    std::chrono::steady_clock::time_point m_token_expiry;
};

} // namespace jb::providers
