#include "jb/providers/youtube.hpp"

#include <dpp/json.h>

#include <cctype>
#include <map>
#include <sstream>

namespace jb::providers {

namespace {

const std::string api_base = "https://www.googleapis.com/youtube/v3";

bool is_id_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

// Take exactly 11 id characters starting at pos.
std::optional<std::string> id_at(const std::string& url, std::size_t pos)
{
    if (pos == std::string::npos || pos + 11 > url.size()) {
        return std::nullopt;
    }
    std::string id = url.substr(pos, 11);
    for (char c : id) {
        if (!is_id_char(c)) {
            return std::nullopt;
        }
    }
    if (pos + 11 < url.size() && is_id_char(url[pos + 11])) {
        return std::nullopt;
    }
    return id;
}

} // namespace

std::optional<std::string> extract_video_id(const std::string& url)
{
    auto p = url.find("youtu.be/");
    if (p != std::string::npos) {
        return id_at(url, p + 9);
    }
    p = url.find("/shorts/");
    if (p != std::string::npos) {
        return id_at(url, p + 8);
    }
    p = url.find("?v=");
    if (p == std::string::npos) {
        p = url.find("&v=");
    }
    if (p != std::string::npos) {
        return id_at(url, p + 3);
    }
    return std::nullopt;
}

std::string watch_url(const std::string& video_id)
{
    return "https://www.youtube.com/watch?v=" + video_id;
}

std::optional<std::chrono::milliseconds> parse_iso8601_duration(const std::string& text)
{
    if (text.size() < 2 || text[0] != 'P') {
        return std::nullopt;
    }

    long long   total_s  = 0;
    bool        time_part = false;
    bool        any       = false;
    std::string digits;

    for (std::size_t i = 1; i < text.size(); ++i) {
        const char c = text[i];
        if (c == 'T') {
            if (!digits.empty() || time_part) {
                return std::nullopt;
            }
            time_part = true;
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
            continue;
        }
        if (digits.empty()) {
            return std::nullopt;
        }

        const long long n = std::stoll(digits);
        digits.clear();
        any = true;

        if (!time_part && c == 'W') {
            total_s += n * 7 * 86400;
        } else if (!time_part && c == 'D') {
            total_s += n * 86400;
        } else if (time_part && c == 'H') {
            total_s += n * 3600;
        } else if (time_part && c == 'M') {
            total_s += n * 60;
        } else if (time_part && c == 'S') {
            total_s += n;
        } else {
            return std::nullopt; // years and months have no fixed length
        }
    }

    if (!digits.empty() || !any) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(total_s * 1000);
}

std::string decode_html_entities(const std::string& text)
{
    static const std::pair<const char*, const char*> entities[] = {
        { "&#39;",  "'" },
        { "&quot;", "\"" },
        { "&lt;",   "<" },
        { "&gt;",   ">" },
        { "&amp;",  "&" }, // last, so "&amp;quot;" stays "&quot;"
    };

    std::string out = text;
    for (const auto& [from, to] : entities) {
        const std::string f(from);
        std::size_t pos = 0;
        while ((pos = out.find(f, pos)) != std::string::npos) {
            out.replace(pos, f.size(), to);
            pos += std::char_traits<char>::length(to);
        }
    }
    return out;
}

youtube_provider::youtube_provider(net::http_client& http,
                                   std::string api_key,
                                   std::chrono::milliseconds timeout,
                                   log_sink log)
    : m_http(http)
    , m_api_key(std::move(api_key))
    , m_timeout(timeout)
    , m_log(std::move(log))
{
}

bool youtube_provider::matches(const std::string& url) const
{
    return url.find("youtube.com/") != std::string::npos
        || url.find("youtu.be/") != std::string::npos;
}

provider_status youtube_provider::lookup_videos(std::vector<candidate>& out, std::string& error)
{
    std::string ids;
    for (const auto& c : out) {
        if (auto id = extract_video_id(c.locator)) {
            if (!ids.empty()) {
                ids += ',';
            }
            ids += *id;
        }
    }
    if (ids.empty()) {
        return provider_status::ok;
    }

    const std::string url = api_base + "/videos?part=snippet,contentDetails&id=" + ids +
                            "&key=" + dpp::utility::url_encode(m_api_key);
    const auto res = m_http.get(url, {}, m_timeout);
    const auto st  = status_from_http(res);
    if (st != provider_status::ok) {
        error = res.timed_out ? "YouTube request timed out"
                              : "YouTube /videos returned HTTP " + std::to_string(res.status);
        return st;
    }

    dpp::json j;
    try {
        j = dpp::json::parse(res.body);
    } catch (const std::exception& e) {
        error = std::string("Failed to parse YouTube /videos response: ") + e.what();
        return provider_status::unavailable;
    }

    struct video_info {
        std::string                              title;
        std::string                              channel;
        std::optional<std::chrono::milliseconds> duration;
    };
    std::map<std::string, video_info> found;

    if (j.contains("items") && j["items"].is_array()) {
        for (const auto& item : j["items"]) {
            if (!item.is_object()) {
                continue;
            }
            video_info info;
            const std::string id = item.value("id", "");
            if (item.contains("snippet") && item["snippet"].is_object()) {
                const auto& sn = item["snippet"];
                info.title   = decode_html_entities(sn.value("title", ""));
                info.channel = sn.value("channelTitle", "");
            }
            if (item.contains("contentDetails") && item["contentDetails"].is_object()) {
                auto d = parse_iso8601_duration(item["contentDetails"].value("duration", ""));
                if (d && d->count() > 0) { // P0D is a live stream
                    info.duration = d;
                }
            }
            found[id] = std::move(info);
        }
    }

    for (auto& c : out) {
        auto id = extract_video_id(c.locator);
        if (!id) {
            continue;
        }
        auto it = found.find(*id);
        if (it == found.end()) {
            continue;
        }
        if (c.title.empty()) {
            c.title = it->second.title;
        }
        if (c.artist.empty()) {
            c.artist = it->second.channel;
        }
        c.duration = it->second.duration;
    }

    if (found.empty()) {
        error = "YouTube returned no video details";
        return provider_status::not_found;
    }
    return provider_status::ok;
}

provider_result youtube_provider::fetch(const std::string& url)
{
    auto id = extract_video_id(url);
    if (!id) {
        return provider_result::failure(provider_status::malformed,
                                        "Could not find a video id in " + url);
    }

    candidate c;
    c.locator = watch_url(*id);
    c.url     = c.locator;

    provider_result res;
    if (m_api_key.empty()) {
        // No metadata without a key; duration stays unknown until decode.
        c.title = c.url;
        res.candidates.push_back(std::move(c));
        return res;
    }

    res.candidates.push_back(std::move(c));

    std::string error;
    const auto  st = lookup_videos(res.candidates, error);
    if (st != provider_status::ok) {
        m_log(dpp::ll_warning, "YouTube lookup for " + *id + " failed: " + error);
        return provider_result::failure(st, error);
    }
    if (res.candidates.front().title.empty()) {
        return provider_result::failure(provider_status::not_found, "Video " + *id + " not found");
    }
    return res;
}

provider_result youtube_provider::search(const std::string& query, std::size_t max_results)
{
    if (m_api_key.empty()) {
        return provider_result::failure(provider_status::unavailable,
                                        "YouTube search needs an API key");
    }

    std::ostringstream url;
    url << api_base << "/search?part=snippet&type=video"
        << "&maxResults=" << max_results
        << "&q=" << dpp::utility::url_encode(query)
        << "&key=" << dpp::utility::url_encode(m_api_key);

    m_log(dpp::ll_debug, "YouTube search: " + query);

    const auto res = m_http.get(url.str(), {}, m_timeout);
    const auto st  = status_from_http(res);
    if (st != provider_status::ok) {
        return provider_result::failure(
            st == provider_status::not_found ? provider_status::unavailable : st,
            res.timed_out ? "YouTube search timed out"
                          : "YouTube search returned HTTP " + std::to_string(res.status));
    }

    dpp::json j;
    try {
        j = dpp::json::parse(res.body);
    } catch (const std::exception& e) {
        return provider_result::failure(provider_status::unavailable,
                                        std::string("Failed to parse YouTube search response: ") + e.what());
    }

    provider_result out;
    if (j.contains("items") && j["items"].is_array()) {
        for (const auto& item : j["items"]) {
            if (!item.is_object() || !item.contains("id") || !item["id"].is_object()) {
                continue;
            }
            const std::string id = item["id"].value("videoId", "");
            if (id.empty()) {
                continue;
            }

            candidate c;
            c.locator = watch_url(id);
            c.url     = c.locator;
            if (item.contains("snippet") && item["snippet"].is_object()) {
                const auto& sn = item["snippet"];
                c.title  = decode_html_entities(sn.value("title", ""));
                c.artist = sn.value("channelTitle", "");
            }
            out.candidates.push_back(std::move(c));
        }
    }

    if (out.candidates.empty()) {
        return provider_result::failure(provider_status::not_found, "No matches for: " + query);
    }

    std::string error;
    if (lookup_videos(out.candidates, error) != provider_status::ok) {
        // Durations are only a ranking hint; keep the results without them.
        m_log(dpp::ll_warning, "YouTube duration lookup failed: " + error);
    }

    std::ostringstream oss;
    oss << "YouTube search returned " << out.candidates.size() << " candidate(s) for: " << query;
    m_log(dpp::ll_debug, oss.str());
    return out;
}

} // namespace jb::providers
