#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstddef>

#include "jb/core/types.hpp"
#include "jb/net/http_client.hpp"

namespace jb::providers {

struct candidate {
    std::string                              title;
    std::string                              artist;
    std::optional<std::chrono::milliseconds> duration;
    std::string                              locator; // provider specific
    std::string                              url;     // page link
};

enum class provider_status {
    ok,
    not_found,
    unavailable,
    malformed
};

struct provider_result {
    provider_status        status = provider_status::ok;
    std::vector<candidate> candidates; // in provider ranking order
    std::string            error_message;

    bool ok() const { return status == provider_status::ok; }

    static provider_result failure(provider_status s, std::string msg);
};

/// Capability shared by every external track provider.
class provider {
public:
    virtual ~provider() = default;

    virtual provider_kind kind() const = 0;

    /// True when the provider's locators can be handed to the media locator.
    virtual bool hosts_audio() const = 0;

    /// True when the URL belongs to this provider.
    virtual bool matches(const std::string& url) const = 0;

    virtual provider_result search(const std::string& query, std::size_t max_results) = 0;

    /// Metadata for a track, playlist or album URL.
    virtual provider_result fetch(const std::string& url) = 0;
};

/// Map an HTTP outcome to a provider status (ok for 2xx).
provider_status status_from_http(const net::http_response& res);

} // namespace jb::providers
