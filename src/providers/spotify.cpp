#include "jb/providers/spotify.hpp"

#include <dpp/json.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace jb::providers {

namespace {

const std::string api_base   = "https://api.spotify.com/v1";
const std::string token_url  = "https://accounts.spotify.com/api/token";
constexpr std::size_t id_len = 22;

std::optional<candidate> candidate_from_track(const dpp::json& t)
{
    if (!t.is_object()) {
        return std::nullopt; // removed or local tracks come back as null
    }

    candidate c;
    c.title = t.value("name", "");
    if (t.contains("artists") && t["artists"].is_array() && !t["artists"].empty() &&
        t["artists"][0].is_object())
    {
        c.artist = t["artists"][0].value("name", "");
    }
    if (t.contains("duration_ms") && t["duration_ms"].is_number_integer()) {
        c.duration = std::chrono::milliseconds(t["duration_ms"].get<std::int64_t>());
    }

    const std::string id = t.value("id", "");
    if (c.title.empty() || id.empty()) {
        return std::nullopt;
    }
    c.locator = "spotify:track:" + id;
    c.url     = "https://open.spotify.com/track/" + id;
    return c;
}

} // namespace

std::optional<spotify_link> parse_spotify_link(const std::string& url)
{
    static const std::pair<const char*, spotify_link::type> kinds[] = {
        { "/track/",    spotify_link::type::track },
        { "/playlist/", spotify_link::type::playlist },
        { "/album/",    spotify_link::type::album },
    };

    if (url.find("spotify.com/") == std::string::npos) {
        return std::nullopt;
    }

    for (const auto& [marker, kind] : kinds) {
        const std::string m(marker);
        const auto p = url.find(m);
        if (p == std::string::npos) {
            continue;
        }
        const auto start = p + m.size();
        if (start + id_len > url.size()) {
            return std::nullopt;
        }
        std::string id = url.substr(start, id_len);
        if (!std::all_of(id.begin(), id.end(),
                         [](char c) { return std::isalnum(static_cast<unsigned char>(c)); })) {
            return std::nullopt;
        }
        return spotify_link{ kind, id };
    }
    return std::nullopt;
}

spotify_provider::spotify_provider(net::http_client& http,
                                   std::string client_id,
                                   std::string client_secret,
                                   std::size_t max_playlist_tracks,
                                   std::chrono::milliseconds timeout,
                                   log_sink log)
    : m_http(http)
    , m_client_id(std::move(client_id))
    , m_client_secret(std::move(client_secret))
    , m_max_playlist_tracks(max_playlist_tracks)
    , m_timeout(timeout)
    , m_log(std::move(log))
{
}

bool spotify_provider::matches(const std::string& url) const
{
    return url.find("spotify.com/") != std::string::npos;
}

std::string spotify_provider::access_token(std::string& error)
{
    std::lock_guard<std::mutex> lock(m_token_mutex);

    if (!m_token.empty() && std::chrono::steady_clock::now() < m_token_expiry) {
        return m_token;
    }

    if (m_client_id.empty() || m_client_secret.empty()) {
        error = "Spotify credentials are not configured";
        return {};
    }

    const std::string creds = m_client_id + ":" + m_client_secret;
    net::header_map headers;
    headers.emplace("Authorization",
                    "Basic " + dpp::base64_encode(reinterpret_cast<const unsigned char*>(creds.data()),
                                                  static_cast<unsigned int>(creds.size())));

    const auto res = m_http.request(dpp::m_post, token_url, "grant_type=client_credentials",
                                    "application/x-www-form-urlencoded", headers, m_timeout);
    if (!res.ok()) {
        error = res.timed_out ? "Spotify token request timed out"
                              : "Spotify token request returned HTTP " + std::to_string(res.status);
        return {};
    }

    try {
        const auto j = dpp::json::parse(res.body);
        m_token = j.value("access_token", "");
        const std::int64_t expires_in = j.value("expires_in", 3600);
        // Refresh a minute early so a request never carries a stale token.
        m_token_expiry = std::chrono::steady_clock::now() +
                         std::chrono::seconds(std::max<std::int64_t>(expires_in - 60, 0));
    } catch (const std::exception& e) {
        error = std::string("Failed to parse Spotify token response: ") + e.what();
        m_token.clear();
        return {};
    }

    if (m_token.empty()) {
        error = "Spotify token response had no access_token";
        return {};
    }

    m_log(dpp::ll_debug, "Spotify access token refreshed");
    return m_token;
}

void spotify_provider::invalidate_token()
{
    std::lock_guard<std::mutex> lock(m_token_mutex);
    m_token.clear();
}

net::http_response spotify_provider::api_get(const std::string& url, std::string& error)
{
    for (int attempt = 0; attempt < 2; ++attempt) {
        const std::string token = access_token(error);
        if (token.empty()) {
            return {};
        }

        net::header_map headers;
        headers.emplace("Authorization", "Bearer " + token);

        auto res = m_http.get(url, headers, m_timeout);
        if (res.status == 401 && attempt == 0) {
            m_log(dpp::ll_info, "Spotify rejected the access token, refreshing");
            invalidate_token();
            continue;
        }
        if (!res.ok()) {
            error = res.timed_out ? "Spotify request timed out"
                                  : "Spotify returned HTTP " + std::to_string(res.status);
        }
        return res;
    }
    return {};
}

provider_result spotify_provider::fetch(const std::string& url)
{
    auto link = parse_spotify_link(url);
    if (!link) {
        return provider_result::failure(provider_status::malformed,
                                        "Unsupported Spotify link: " + url);
    }
    if (link->kind == spotify_link::type::track) {
        return fetch_track(link->id);
    }
    return fetch_collection(*link);
}

provider_result spotify_provider::fetch_track(const std::string& id)
{
    std::string error;
    const auto  res = api_get(api_base + "/tracks/" + id, error);
    if (!res.ok()) {
        return provider_result::failure(status_from_http(res), error);
    }

    try {
        auto c = candidate_from_track(dpp::json::parse(res.body));
        if (!c) {
            return provider_result::failure(provider_status::not_found, "Spotify track " + id + " has no metadata");
        }
        provider_result out;
        out.candidates.push_back(std::move(*c));
        return out;
    } catch (const std::exception& e) {
        return provider_result::failure(provider_status::unavailable,
                                        std::string("Failed to parse Spotify track: ") + e.what());
    }
}

provider_result spotify_provider::fetch_collection(const spotify_link& link)
{
    const bool        playlist = link.kind == spotify_link::type::playlist;
    const std::size_t limit    = std::min<std::size_t>(m_max_playlist_tracks, playlist ? 100 : 50);

    std::ostringstream url;
    url << api_base << (playlist ? "/playlists/" : "/albums/") << link.id
        << "/tracks?limit=" << limit;

    std::string error;
    const auto  res = api_get(url.str(), error);
    if (!res.ok()) {
        return provider_result::failure(status_from_http(res), error);
    }

    dpp::json j;
    try {
        j = dpp::json::parse(res.body);
    } catch (const std::exception& e) {
        return provider_result::failure(provider_status::unavailable,
                                        std::string("Failed to parse Spotify collection: ") + e.what());
    }

    provider_result out;
    if (j.contains("items") && j["items"].is_array()) {
        for (const auto& item : j["items"]) {
            // Playlist items wrap the track; album items are the track.
            const dpp::json& t = (playlist && item.is_object() && item.contains("track")) ? item["track"] : item;
            if (auto c = candidate_from_track(t)) {
                out.candidates.push_back(std::move(*c));
            }
            if (out.candidates.size() >= m_max_playlist_tracks) {
                break;
            }
        }
    }

    if (out.candidates.empty()) {
        return provider_result::failure(provider_status::not_found, "Spotify collection " + link.id + " is empty");
    }

    std::ostringstream oss;
    oss << "Loaded " << out.candidates.size() << " track(s) from Spotify "
        << (playlist ? "playlist " : "album ") << link.id;
    m_log(dpp::ll_info, oss.str());
    return out;
}

provider_result spotify_provider::search(const std::string& query, std::size_t max_results)
{
    std::ostringstream url;
    url << api_base << "/search?type=track&limit=" << max_results
        << "&q=" << dpp::utility::url_encode(query);

    std::string error;
    const auto  res = api_get(url.str(), error);
    if (!res.ok()) {
        const auto st = status_from_http(res);
        return provider_result::failure(st == provider_status::not_found ? provider_status::unavailable : st, error);
    }

    provider_result out;
    try {
        const auto j = dpp::json::parse(res.body);
        if (j.contains("tracks") && j["tracks"].is_object() &&
            j["tracks"].contains("items") && j["tracks"]["items"].is_array())
        {
            for (const auto& t : j["tracks"]["items"]) {
                if (auto c = candidate_from_track(t)) {
                    out.candidates.push_back(std::move(*c));
                }
            }
        }
    } catch (const std::exception& e) {
        return provider_result::failure(provider_status::unavailable,
                                        std::string("Failed to parse Spotify search: ") + e.what());
    }

    if (out.candidates.empty()) {
        return provider_result::failure(provider_status::not_found, "No Spotify matches for: " + query);
    }
    return out;
}

} // namespace jb::providers
