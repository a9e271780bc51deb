#pragma once

#include <string>
#include <optional>
#include <chrono>

#include "jb/providers/provider.hpp"

namespace jb::providers {

/// YouTube Data API v3. Hosts audio: its locators are watch URLs.
class youtube_provider : public provider {
public:
    youtube_provider(net::http_client& http,
                     std::string api_key,
                     std::chrono::milliseconds timeout,
                     log_sink log);

    provider_kind kind() const override { return provider_kind::youtube; }
    bool hosts_audio() const override { return true; }
    bool matches(const std::string& url) const override;

    provider_result search(const std::string& query, std::size_t max_results) override;
    provider_result fetch(const std::string& url) override;

private:
    // Fill durations (and titles when missing) from /videos for the given candidates.
    provider_status lookup_videos(std::vector<candidate>& out, std::string& error);

    net::http_client&         m_http;
    std::string               m_api_key;
    std::chrono::milliseconds m_timeout;
    log_sink                  m_log;
};

/// 11-character video id from watch, youtu.be and shorts links.
std::optional<std::string> extract_video_id(const std::string& url);

std::string watch_url(const std::string& video_id);

/// ISO 8601 duration as used by contentDetails.duration, e.g. "PT1H2M3S".
std::optional<std::chrono::milliseconds> parse_iso8601_duration(const std::string& text);

/// Undo the HTML entities the search API leaves in titles.
std::string decode_html_entities(const std::string& text);

} // namespace jb::providers
