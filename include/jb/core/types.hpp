#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>
#include <functional>

#include <dpp/dpp.h>

#include "jb/core/errors.hpp"

namespace jb {

// Log through the cluster (or a test recorder) without holding a cluster&.
using log_sink = std::function<void(dpp::loglevel, const std::string&)>;

// Voice frame format: s16le, 48 kHz, stereo, 20 ms.
constexpr int                       sample_rate        = 48000;
constexpr int                       channel_count      = 2;
constexpr std::chrono::milliseconds frame_duration{20};
constexpr std::size_t               samples_per_frame  = sample_rate / 1000 * 20;
constexpr std::size_t               frame_bytes        = samples_per_frame * channel_count * sizeof(std::int16_t);

enum class reference_kind {
    url,
    search_query
};

enum class provider_kind {
    youtube,
    spotify
};

const char* to_string(provider_kind p);

struct track_reference {
    reference_kind               kind = reference_kind::search_query;
    std::optional<provider_kind> provider_hint;
    std::string                  raw_text;

    /// Classify raw user input: anything starting with http is a URL.
    static track_reference from_user_input(const std::string& text);
};

struct resolved_track {
    std::string                              title;
    std::string                              artist;
    std::optional<std::chrono::milliseconds> duration;
    provider_kind                            provider = provider_kind::youtube;
    std::string                              provider_locator; // what the media locator consumes
    std::string                              url;              // page link for display
    dpp::snowflake                           requested_by;
};

struct queue_entry {
    std::uint64_t  id = 0;
    resolved_track track;
};

/// A concrete, short-lived source the decoder can open.
struct media_source {
    std::string url;
    std::chrono::steady_clock::time_point located_at;
};

struct audio_frame {
    std::uint64_t             sequence = 0;
    std::vector<std::uint8_t> payload; // frame_bytes of PCM
};

enum class session_mode {
    idle,
    playing,
    paused,
    stopping
};

const char* to_string(session_mode m);

struct voice_channel {
    dpp::snowflake guild_id;
    dpp::snowflake channel_id;
};

// ---------- Engine events ----------

enum class event_type {
    track_started,
    track_ended,
    queue_empty,
    error
};

enum class end_reason {
    finished,      // decoder reached normal EOF
    skipped,
    removed,
    stopped,
    locate_error,
    decode_error,
    transport_error
};

const char* to_string(end_reason r);

struct playback_event {
    event_type                 type = event_type::error;
    dpp::snowflake             session_id;
    std::optional<queue_entry> entry;
    end_reason                 reason = end_reason::finished;
    error_code                 error  = error_code::none;
    std::string                message;
};

using event_sink = std::function<void(const playback_event&)>;

std::string format_duration(std::chrono::milliseconds d);

} // namespace jb
