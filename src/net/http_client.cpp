#include "jb/net/http_client.hpp"

#include <future>
#include <memory>
#include <sstream>

namespace jb::net {

namespace {

const char* method_name(dpp::http_method m)
{
    switch (m) {
    case dpp::m_get:    return "GET";
    case dpp::m_post:   return "POST";
    case dpp::m_put:    return "PUT";
    case dpp::m_patch:  return "PATCH";
    case dpp::m_delete: return "DELETE";
    default:            return "?";
    }
}

} // namespace

std::string redact_url(const std::string& url)
{
    const auto q = url.find('?');
    return q == std::string::npos ? url : url.substr(0, q) + "?...";
}

dpp_http_client::dpp_http_client(dpp::cluster& cluster)
    : m_cluster(cluster)
{
}

http_response dpp_http_client::request(dpp::http_method method,
                                       const std::string& url,
                                       const std::string& body,
                                       const std::string& content_type,
                                       const header_map& headers,
                                       std::chrono::milliseconds timeout)
{
    const std::string method_str = method_name(method);
    const std::string shown_url  = redact_url(url);

    m_cluster.log(
        dpp::ll_debug,
        "HTTP request: " + method_str + " " + shown_url + " (body=" +
        (body.empty() ? "empty" : std::to_string(body.size()) + " bytes") + ")"
    );

    // The callback may outlive this call on timeout, so it owns the promise.
    auto prom = std::make_shared<std::promise<dpp::http_request_completion_t>>();
    auto fut  = prom->get_future();

    try {
        m_cluster.request(
            url,
            method,
            [this, method_str, shown_url, prom](const dpp::http_request_completion_t& cc) {
                std::ostringstream oss;
                oss << "HTTP " << cc.status
                    << " on " << method_str << " " << shown_url
                    << " (response length=" << cc.body.size() << ")";

                if (cc.status == 0) {
                    m_cluster.log(dpp::ll_warning, oss.str() + " (request failed)");
                } else if (cc.status >= 400) {
                    m_cluster.log(dpp::ll_warning, oss.str() + " response: " + cc.body);
                } else {
                    m_cluster.log(dpp::ll_debug, oss.str());
                }

                prom->set_value(cc);
            },
            body,
            content_type.empty() ? "text/plain" : content_type,
            headers
        );
    } catch (const std::exception& e) {
        m_cluster.log(dpp::ll_warning,
                      "HTTP " + method_str + " " + shown_url + " could not be queued: " + e.what());
        return {};
    }

    http_response res;
    if (fut.wait_for(timeout) != std::future_status::ready) {
        std::ostringstream oss;
        oss << "HTTP " << method_str << " " << shown_url
            << " timed out after " << timeout.count() << " ms";
        m_cluster.log(dpp::ll_warning, oss.str());
        res.timed_out = true;
        return res;
    }

    const auto cc = fut.get();
    res.status = cc.status;
    res.body   = cc.body;
    return res;
}

} // namespace jb::net
