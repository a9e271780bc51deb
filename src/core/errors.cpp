#include "jb/core/errors.hpp"

namespace jb {

const char* to_string(error_code code)
{
    switch (code) {
    case error_code::none:                            return "ok";
    case error_code::resolution_not_found:            return "No matches";
    case error_code::resolution_provider_unavailable: return "Track provider unavailable";
    case error_code::resolution_malformed:            return "Cannot play this type of link";
    case error_code::locate_expired:                  return "Media is no longer available";
    case error_code::locate_provider_unavailable:     return "Media source unavailable";
    case error_code::decode_process_failed:           return "Decoder failed";
    case error_code::decode_malformed_output:         return "Decoder produced malformed audio";
    case error_code::invalid_state:                   return "Not possible right now";
    case error_code::entry_not_found:                 return "No such queue entry";
    case error_code::session_not_found:               return "Not in a voice channel";
    case error_code::transport_disconnected:          return "Voice connection lost";
    case error_code::transport_send_failed:           return "Failed to send audio";
    }
    return "unknown error";
}

bool is_resolution_error(error_code code)
{
    return code == error_code::resolution_not_found
        || code == error_code::resolution_provider_unavailable
        || code == error_code::resolution_malformed;
}

bool is_locate_error(error_code code)
{
    return code == error_code::locate_expired
        || code == error_code::locate_provider_unavailable;
}

bool is_decode_error(error_code code)
{
    return code == error_code::decode_process_failed
        || code == error_code::decode_malformed_output;
}

command_result command_result::failure(error_code c, std::string msg)
{
    command_result r;
    r.code    = c;
    r.message = msg.empty() ? std::string(to_string(c)) : std::move(msg);
    return r;
}

} // namespace jb
