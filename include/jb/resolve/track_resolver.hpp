#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <cstddef>

#include "jb/core/types.hpp"
#include "jb/providers/provider.hpp"

namespace jb::resolve {

struct resolve_result {
    error_code                  code = error_code::none;
    std::vector<resolved_track> tracks; // one for a track, several for a playlist
    std::string                 error_message;

    bool ok() const { return code == error_code::none; }
};

/// Turns a user reference into playable tracks. Stateless between calls,
/// safe to use from several command threads at once if the providers are.
class track_resolver {
public:
    track_resolver(std::vector<std::shared_ptr<providers::provider>> providers,
                   log_sink log,
                   std::size_t search_results = 5);

    resolve_result resolve(const track_reference& reference, dpp::snowflake requested_by);

private:
    using search_memo = std::map<std::string, providers::provider_result>;

    providers::provider* find_for_url(const track_reference& reference) const;
    providers::provider* audio_provider() const;

    resolve_result resolve_direct(providers::provider& p, const track_reference& reference,
                                  dpp::snowflake requested_by);
    resolve_result resolve_via_metadata(providers::provider& meta, const track_reference& reference,
                                        dpp::snowflake requested_by);
    resolve_result resolve_query(const std::string& query, dpp::snowflake requested_by);

    // Search the audio provider for a metadata candidate.
    providers::provider_result match(const providers::candidate& meta, search_memo& memo);

    resolved_track to_track(const providers::candidate& c, provider_kind kind,
                            dpp::snowflake requested_by) const;

    std::vector<std::shared_ptr<providers::provider>> m_providers;
    log_sink                                         m_log;
    std::size_t                                      m_search_results;
};

/// First candidate within +/-10% of target, else the first one.
std::size_t pick_by_duration(const std::vector<providers::candidate>& candidates,
                             const std::optional<std::chrono::milliseconds>& target);

error_code to_resolution_error(providers::provider_status s);

} // namespace jb::resolve
