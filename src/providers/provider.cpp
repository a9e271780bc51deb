#include "jb/providers/provider.hpp"

namespace jb::providers {

provider_result provider_result::failure(provider_status s, std::string msg)
{
    provider_result r;
    r.status        = s;
    r.error_message = std::move(msg);
    return r;
}

provider_status status_from_http(const net::http_response& res)
{
    if (res.ok()) {
        return provider_status::ok;
    }
    if (res.status == 404) {
        return provider_status::not_found;
    }
    // timeouts, transport failures, auth, quota and server errors
    return provider_status::unavailable;
}

} // namespace jb::providers
