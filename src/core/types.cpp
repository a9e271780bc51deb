#include "jb/core/types.hpp"

#include <iomanip>
#include <sstream>

namespace jb {

const char* to_string(provider_kind p)
{
    switch (p) {
    case provider_kind::youtube: return "youtube";
    case provider_kind::spotify: return "spotify";
    }
    return "unknown";
}

const char* to_string(session_mode m)
{
    switch (m) {
    case session_mode::idle:     return "idle";
    case session_mode::playing:  return "playing";
    case session_mode::paused:   return "paused";
    case session_mode::stopping: return "stopping";
    }
    return "unknown";
}

const char* to_string(end_reason r)
{
    switch (r) {
    case end_reason::finished:        return "finished";
    case end_reason::skipped:         return "skipped";
    case end_reason::removed:         return "removed";
    case end_reason::stopped:         return "stopped";
    case end_reason::locate_error:    return "locate error";
    case end_reason::decode_error:    return "decode error";
    case end_reason::transport_error: return "transport error";
    }
    return "unknown";
}

track_reference track_reference::from_user_input(const std::string& text)
{
    track_reference ref;

    const auto first = text.find_first_not_of(" \t\r\n");
    const auto last  = text.find_last_not_of(" \t\r\n");
    ref.raw_text = (first == std::string::npos) ? std::string{} : text.substr(first, last - first + 1);

    if (ref.raw_text.rfind("http", 0) == 0) {
        ref.kind = reference_kind::url;
        if (ref.raw_text.find("spotify.com/") != std::string::npos) {
            ref.provider_hint = provider_kind::spotify;
        } else if (ref.raw_text.find("youtube.com/") != std::string::npos ||
                   ref.raw_text.find("youtu.be/") != std::string::npos) {
            ref.provider_hint = provider_kind::youtube;
        }
    } else {
        ref.kind = reference_kind::search_query;
    }
    return ref;
}

std::string format_duration(std::chrono::milliseconds d)
{
    const auto secs  = d.count() / 1000;
    const auto mins  = secs / 60;
    const auto hours = mins / 60;

    std::ostringstream oss;
    oss << std::setfill('0');
    if (hours != 0) {
        oss << std::setw(2) << hours << ':';
    }
    oss << std::setw(2) << (mins % 60) << ':' << std::setw(2) << (secs % 60);
    return oss.str();
}

} // namespace jb
