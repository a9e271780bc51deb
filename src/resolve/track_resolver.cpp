#include "jb/resolve/track_resolver.hpp"

#include <cstdlib>
#include <sstream>

namespace jb::resolve {

using providers::candidate;
using providers::provider;
using providers::provider_result;
using providers::provider_status;

error_code to_resolution_error(provider_status s)
{
    switch (s) {
    case provider_status::ok:          return error_code::none;
    case provider_status::not_found:   return error_code::resolution_not_found;
    case provider_status::unavailable: return error_code::resolution_provider_unavailable;
    case provider_status::malformed:   return error_code::resolution_malformed;
    }
    return error_code::resolution_provider_unavailable;
}

std::size_t pick_by_duration(const std::vector<candidate>& candidates,
                             const std::optional<std::chrono::milliseconds>& target)
{
    if (!target || target->count() <= 0) {
        return 0;
    }

    const auto tolerance = target->count() / 10;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        const auto& d = candidates[i].duration;
        if (d && std::llabs(d->count() - target->count()) <= tolerance) {
            return i;
        }
    }
    return 0;
}

namespace {

resolve_result failure(error_code code, std::string message)
{
    resolve_result r;
    r.code          = code;
    r.error_message = std::move(message);
    return r;
}

} // namespace

track_resolver::track_resolver(std::vector<std::shared_ptr<provider>> providers,
                               log_sink log,
                               std::size_t search_results)
    : m_providers(std::move(providers))
    , m_log(std::move(log))
    , m_search_results(search_results)
{
}

provider* track_resolver::find_for_url(const track_reference& reference) const
{
    if (reference.provider_hint) {
        for (const auto& p : m_providers) {
            if (p->kind() == *reference.provider_hint) {
                return p.get();
            }
        }
    }
    for (const auto& p : m_providers) {
        if (p->matches(reference.raw_text)) {
            return p.get();
        }
    }
    return nullptr;
}

provider* track_resolver::audio_provider() const
{
    for (const auto& p : m_providers) {
        if (p->hosts_audio()) {
            return p.get();
        }
    }
    return nullptr;
}

resolved_track track_resolver::to_track(const candidate& c, provider_kind kind,
                                        dpp::snowflake requested_by) const
{
    resolved_track t;
    t.title            = c.title.empty() ? c.url : c.title;
    t.artist           = c.artist;
    t.duration         = c.duration;
    t.provider         = kind;
    t.provider_locator = c.locator;
    t.url              = c.url;
    t.requested_by     = requested_by;
    return t;
}

resolve_result track_resolver::resolve(const track_reference& reference, dpp::snowflake requested_by)
{
    if (reference.raw_text.empty()) {
        return failure(error_code::resolution_malformed, "Nothing to play");
    }

    resolve_result res;
    if (reference.kind == reference_kind::url) {
        provider* p = find_for_url(reference);
        if (!p) {
            return failure(error_code::resolution_malformed,
                           "Cannot play this type of link: " + reference.raw_text);
        }
        res = p->hosts_audio() ? resolve_direct(*p, reference, requested_by)
                               : resolve_via_metadata(*p, reference, requested_by);
    } else {
        res = resolve_query(reference.raw_text, requested_by);
    }

    std::ostringstream oss;
    if (res.ok()) {
        oss << "Resolved '" << reference.raw_text << "' to " << res.tracks.size() << " track(s)";
        if (!res.tracks.empty()) {
            oss << ", first: " << res.tracks.front().title;
        }
        m_log(dpp::ll_info, oss.str());
    } else {
        oss << "Could not resolve '" << reference.raw_text << "': "
            << to_string(res.code) << " (" << res.error_message << ")";
        m_log(dpp::ll_warning, oss.str());
    }
    return res;
}

resolve_result track_resolver::resolve_direct(provider& p, const track_reference& reference,
                                              dpp::snowflake requested_by)
{
    const auto pr = p.fetch(reference.raw_text);
    if (!pr.ok()) {
        return failure(to_resolution_error(pr.status), pr.error_message);
    }
    if (pr.candidates.empty()) {
        return failure(error_code::resolution_not_found, "No matches");
    }

    resolve_result res;
    res.tracks.push_back(to_track(pr.candidates.front(), p.kind(), requested_by));
    return res;
}

provider_result track_resolver::match(const candidate& meta, search_memo& memo)
{
    provider* audio = audio_provider();
    if (!audio) {
        return provider_result::failure(provider_status::unavailable, "No audio provider configured");
    }

    const std::string query = meta.artist.empty() ? meta.title : meta.artist + " " + meta.title;

    auto it = memo.find(query);
    if (it == memo.end()) {
        it = memo.emplace(query, audio->search(query, m_search_results)).first;
    }
    return it->second;
}

resolve_result track_resolver::resolve_via_metadata(provider& meta, const track_reference& reference,
                                                    dpp::snowflake requested_by)
{
    const auto pr = meta.fetch(reference.raw_text);
    if (!pr.ok()) {
        return failure(to_resolution_error(pr.status), pr.error_message);
    }

    provider* audio = audio_provider();
    if (!audio) {
        return failure(error_code::resolution_provider_unavailable, "No audio provider configured");
    }

    search_memo    memo;
    resolve_result res;
    resolve_result first_failure;

    for (const auto& m : pr.candidates) {
        const auto found = match(m, memo);
        if (!found.ok() || found.candidates.empty()) {
            if (first_failure.ok()) {
                first_failure = failure(to_resolution_error(found.ok() ? provider_status::not_found : found.status),
                                        found.error_message);
            }
            m_log(dpp::ll_warning, "No playable match for " + m.artist + " - " + m.title);
            continue;
        }

        const auto& pick = found.candidates[pick_by_duration(found.candidates, m.duration)];
        resolved_track t = to_track(pick, audio->kind(), requested_by);
        // Keep the metadata provider's naming; the audio match may be a lyric video.
        t.title  = m.title;
        t.artist = m.artist;
        if (!t.duration) {
            t.duration = m.duration;
        }
        res.tracks.push_back(std::move(t));
    }

    if (res.tracks.empty()) {
        return first_failure.ok() ? failure(error_code::resolution_not_found, "No matches") : first_failure;
    }
    return res;
}

resolve_result track_resolver::resolve_query(const std::string& query, dpp::snowflake requested_by)
{
    provider* audio = audio_provider();
    if (!audio) {
        return failure(error_code::resolution_provider_unavailable, "No audio provider configured");
    }

    const auto pr = audio->search(query, m_search_results);
    if (!pr.ok()) {
        return failure(to_resolution_error(pr.status), pr.error_message);
    }
    if (pr.candidates.empty()) {
        return failure(error_code::resolution_not_found, "No matches for: " + query);
    }

    resolve_result res;
    res.tracks.push_back(to_track(pr.candidates.front(), audio->kind(), requested_by));
    return res;
}

} // namespace jb::resolve
