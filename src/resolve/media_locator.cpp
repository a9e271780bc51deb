#include "jb/resolve/media_locator.hpp"

#include "jb/util/subprocess.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace jb::resolve {

error_code classify_ytdlp_failure(const std::string& stderr_text)
{
    std::string lower = stderr_text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const char* gone_markers[] = {
        "video unavailable",
        "private video",
        "has been removed",
        "no longer available",
        "account associated with this video has been terminated",
        "http error 404",
        "http error 410",
    };
    for (const char* m : gone_markers) {
        if (lower.find(m) != std::string::npos) {
            return error_code::locate_expired;
        }
    }
    return error_code::locate_provider_unavailable;
}

ytdlp_media_locator::ytdlp_media_locator(std::string executable,
                                         std::chrono::milliseconds timeout,
                                         log_sink log)
    : m_executable(std::move(executable))
    , m_timeout(timeout)
    , m_log(std::move(log))
{
}

locate_result ytdlp_media_locator::locate(const resolved_track& track, const util::cancel_token& cancel)
{
    locate_result res;

    if (track.provider != provider_kind::youtube || track.provider_locator.empty()) {
        res.code          = error_code::locate_provider_unavailable;
        res.error_message = std::string("No media locator for provider ") + to_string(track.provider);
        return res;
    }

    const std::vector<std::string> argv{
        m_executable, "-f", "bestaudio/best", "-g",
        "--no-playlist", "--no-warnings", "--", track.provider_locator
    };

    m_log(dpp::ll_debug, "Locating media for " + track.provider_locator);

    const auto run = util::run_capture(argv, m_timeout, cancel);

    if (run.cancelled) {
        res.code          = error_code::locate_provider_unavailable;
        res.error_message = "cancelled";
        return res;
    }
    if (!run.spawned) {
        res.code          = error_code::locate_provider_unavailable;
        res.error_message = run.err;
        m_log(dpp::ll_warning, "Could not start " + m_executable + ": " + run.err);
        return res;
    }
    if (run.timed_out) {
        std::ostringstream oss;
        oss << m_executable << " timed out after " << m_timeout.count() << " ms";
        res.code          = error_code::locate_provider_unavailable;
        res.error_message = oss.str();
        m_log(dpp::ll_warning, oss.str() + " for " + track.provider_locator);
        return res;
    }
    if (!run.status.success()) {
        res.code          = classify_ytdlp_failure(run.err);
        res.error_message = run.err.empty() ? m_executable + " failed" : run.err;

        std::ostringstream oss;
        oss << m_executable << " exited with " << run.status.code
            << " for " << track.provider_locator << ": " << run.err;
        m_log(dpp::ll_warning, oss.str());
        return res;
    }

    std::istringstream lines(run.out);
    std::string        url;
    std::getline(lines, url);
    while (!url.empty() && std::isspace(static_cast<unsigned char>(url.back()))) {
        url.pop_back();
    }

    if (url.empty()) {
        res.code          = error_code::locate_expired;
        res.error_message = m_executable + " returned no media URL";
        return res;
    }

    res.source.url        = url;
    res.source.located_at = std::chrono::steady_clock::now();
    return res;
}

} // namespace jb::resolve
