#pragma once

#include <map>
#include <string>
#include <chrono>
#include <cstdint>

#include <dpp/dpp.h>

namespace jb::net {

using header_map = std::multimap<std::string, std::string>;

struct http_response {
    std::uint16_t status    = 0;     // 0 = request never completed
    bool          timed_out = false;
    std::string   body;

    bool ok() const { return status >= 200 && status < 300; }
};

/// Blocking request/response seam in front of the providers.
class http_client {
public:
    virtual ~http_client() = default;

    virtual http_response request(dpp::http_method method,
                                  const std::string& url,
                                  const std::string& body,
                                  const std::string& content_type,
                                  const header_map& headers,
                                  std::chrono::milliseconds timeout) = 0;

    http_response get(const std::string& url,
                      const header_map& headers,
                      std::chrono::milliseconds timeout)
    {
        return request(dpp::m_get, url, {}, {}, headers, timeout);
    }
};

/// http_client over dpp::cluster::request. Must not be used before the
/// cluster is started.
class dpp_http_client : public http_client {
public:
    explicit dpp_http_client(dpp::cluster& cluster);

    http_response request(dpp::http_method method,
                          const std::string& url,
                          const std::string& body,
                          const std::string& content_type,
                          const header_map& headers,
                          std::chrono::milliseconds timeout) override;

private:
    dpp::cluster& m_cluster;
};

/// Drop the query string so API keys never reach the log.
std::string redact_url(const std::string& url);

} // namespace jb::net
