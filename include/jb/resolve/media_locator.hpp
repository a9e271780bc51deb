#pragma once

#include <string>
#include <chrono>

#include "jb/core/types.hpp"
#include "jb/util/cancel_token.hpp"

namespace jb::resolve {

struct locate_result {
    error_code   code = error_code::none;
    media_source source;
    std::string  error_message;

    bool ok() const { return code == error_code::none; }
};

/// Turns a resolved track into a short-lived media URL right before decode.
class media_locator {
public:
    virtual ~media_locator() = default;

    /// Blocks until located, failed, or cancel is set. A cancelled call's
    /// result is discarded by the caller.
    virtual locate_result locate(const resolved_track& track, const util::cancel_token& cancel) = 0;
};

/// yt-dlp -g: prints the direct media URL for a watch page.
class ytdlp_media_locator : public media_locator {
public:
    ytdlp_media_locator(std::string executable,
                        std::chrono::milliseconds timeout,
                        log_sink log);

    locate_result locate(const resolved_track& track, const util::cancel_token& cancel) override;

private:
    std::string               m_executable;
    std::chrono::milliseconds m_timeout;
    log_sink                  m_log;
};

/// Expired when yt-dlp says the video itself is gone, otherwise unavailable.
error_code classify_ytdlp_failure(const std::string& stderr_text);

} // namespace jb::resolve
