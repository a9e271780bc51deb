#pragma once

// Test doubles for the seams of the playback stack.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "jb/audio/frame_stream.hpp"
#include "jb/net/http_client.hpp"
#include "jb/providers/provider.hpp"
#include "jb/resolve/media_locator.hpp"
#include "jb/voice/voice_transport.hpp"

namespace jb::test {

inline log_sink quiet_log()
{
    return [](dpp::loglevel, const std::string&) {};
}

// Poll until pred holds or timeout passes.
template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

inline resolved_track make_track(const std::string& name,
                                 std::optional<std::chrono::milliseconds> duration = std::nullopt)
{
    resolved_track t;
    t.title            = name;
    t.artist           = "artist";
    t.duration         = duration;
    t.provider         = provider_kind::youtube;
    t.provider_locator = name;
    t.url              = "https://www.youtube.com/watch?v=" + name;
    return t;
}

// ============================================================================
// HTTP
// ============================================================================

class fake_http_client : public net::http_client {
public:
    struct call {
        dpp::http_method method;
        std::string      url;
        std::string      body;
        net::header_map  headers;
    };

    using handler = std::function<net::http_response(const call&)>;

    handler on_request;

    net::http_response request(dpp::http_method method,
                               const std::string& url,
                               const std::string& body,
                               const std::string&,
                               const net::header_map& headers,
                               std::chrono::milliseconds) override
    {
        call c{ method, url, body, headers };
        {
            std::lock_guard<std::mutex> lock(mutex);
            calls.push_back(c);
        }
        if (!on_request) {
            return {};
        }
        return on_request(c);
    }

    std::size_t count_containing(const std::string& fragment) const
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::size_t n = 0;
        for (const auto& c : calls) {
            if (c.url.find(fragment) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }

    mutable std::mutex mutex;
    std::vector<call>  calls;
};

inline net::http_response respond(std::uint16_t status, std::string body)
{
    net::http_response r;
    r.status = status;
    r.body   = std::move(body);
    return r;
}

// ============================================================================
// Providers
// ============================================================================

class fake_provider : public providers::provider {
public:
    fake_provider(provider_kind kind, bool audio, std::string host)
        : m_kind(kind)
        , m_audio(audio)
        , m_host(std::move(host))
    {
    }

    provider_kind kind() const override { return m_kind; }
    bool hosts_audio() const override { return m_audio; }

    bool matches(const std::string& url) const override
    {
        return url.find(m_host) != std::string::npos;
    }

    providers::provider_result search(const std::string& query, std::size_t) override
    {
        ++search_calls;
        queries.push_back(query);
        auto it = search_results.find(query);
        if (it == search_results.end()) {
            return providers::provider_result::failure(providers::provider_status::not_found, "no results");
        }
        return it->second;
    }

    providers::provider_result fetch(const std::string& url) override
    {
        auto it = fetch_results.find(url);
        if (it == fetch_results.end()) {
            return providers::provider_result::failure(providers::provider_status::not_found, "unknown url");
        }
        return it->second;
    }

    std::map<std::string, providers::provider_result> search_results;
    std::map<std::string, providers::provider_result> fetch_results;
    std::vector<std::string>                          queries;
    int                                               search_calls = 0;

private:
    provider_kind m_kind;
    bool          m_audio;
    std::string   m_host;
};

inline providers::candidate make_candidate(const std::string& title,
                                           const std::string& locator,
                                           std::optional<std::chrono::milliseconds> duration = std::nullopt,
                                           const std::string& artist = "artist")
{
    providers::candidate c;
    c.title    = title;
    c.artist   = artist;
    c.duration = duration;
    c.locator  = locator;
    c.url      = "https://example.test/" + locator;
    return c;
}

inline providers::provider_result found(std::vector<providers::candidate> candidates)
{
    providers::provider_result r;
    r.candidates = std::move(candidates);
    return r;
}

// ============================================================================
// Media locator
// ============================================================================

/// Locates "fake://<locator>". Tracks listed in failures fail with that code;
/// with blocking set, calls wait until release() or cancellation.
class fake_locator : public resolve::media_locator {
public:
    resolve::locate_result locate(const resolved_track& track, const util::cancel_token& cancel) override
    {
        ++calls;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            ++m_waiting;
            // Cancellation is not signalled, so poll for it.
            while (blocking && !m_released && !cancel.cancelled()) {
                m_cv.wait_for(lock, std::chrono::milliseconds(5));
            }
            --m_waiting;
        }

        resolve::locate_result r;
        if (cancel.cancelled()) {
            r.code          = error_code::locate_provider_unavailable;
            r.error_message = "cancelled";
            return r;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = failures.find(track.provider_locator);
        if (it != failures.end()) {
            r.code          = it->second;
            r.error_message = "fake failure";
            return r;
        }
        r.source.url        = "fake://" + track.provider_locator;
        r.source.located_at = std::chrono::steady_clock::now();
        return r;
    }

    void release()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_released = true;
        }
        m_cv.notify_all();
    }

    int waiting() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_waiting;
    }

    void fail(const std::string& locator, error_code code)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        failures[locator] = code;
    }

    std::atomic<bool> blocking{ false };
    std::atomic<int>  calls{ 0 };

private:
    mutable std::mutex              m_mutex;
    std::condition_variable         m_cv;
    bool                            m_released = false;
    int                             m_waiting  = 0;
    std::map<std::string, error_code> failures;
};

// ============================================================================
// Transcoder
// ============================================================================

struct stream_stats {
    std::atomic<int> active{ 0 };
    std::atomic<int> peak{ 0 };
    std::atomic<int> started{ 0 };

    void opened()
    {
        const int now = ++active;
        ++started;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {
        }
    }
};

/// Emits frames tagged with the first byte of the track locator.
class fake_stream : public audio::frame_stream {
public:
    fake_stream(std::shared_ptr<stream_stats> stats, char tag, std::uint64_t start,
                std::uint64_t total, error_code fail_with)
        : m_stats(std::move(stats))
        , m_tag(tag)
        , m_next(start)
        , m_total(total)
        , m_fail(fail_with)
    {
        m_stats->opened();
    }

    ~fake_stream() override { stop(); }

    audio::frame_status next(audio_frame& out, std::chrono::milliseconds) override
    {
        if (m_stopped) {
            return audio::frame_status::end_of_stream;
        }
        if (m_next >= m_total) {
            return m_fail == error_code::none ? audio::frame_status::end_of_stream
                                              : audio::frame_status::decode_error;
        }
        out.sequence = m_next++;
        out.payload.assign(frame_bytes, 0);
        out.payload[0] = static_cast<std::uint8_t>(m_tag);
        return audio::frame_status::frame;
    }

    error_code  error() const override { return m_fail; }
    std::string error_message() const override { return "exit status 1"; }

    void stop() override
    {
        if (!m_stopped) {
            m_stopped = true;
            --m_stats->active;
        }
    }

private:
    std::shared_ptr<stream_stats> m_stats;
    char                          m_tag;
    std::uint64_t                 m_next;
    std::uint64_t                 m_total;
    error_code                    m_fail;
    bool                          m_stopped = false;
};

class fake_transcoder : public audio::transcoder {
public:
    struct start_call {
        std::string   url;
        std::uint64_t start_frame;
    };

    std::unique_ptr<audio::frame_stream> start(const media_source& source,
                                               std::uint64_t start_frame,
                                               std::string& error) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_starts.push_back({ source.url, start_frame });

        const std::string locator = source.url.substr(std::string("fake://").size());
        if (refuse.count(locator)) {
            error = "spawn failed";
            return nullptr;
        }

        std::uint64_t total = frames_per_track;
        error_code    fail  = error_code::none;
        auto it = failures.find(locator);
        if (it != failures.end()) {
            total = it->second.first;
            fail  = it->second.second;
        }
        return std::make_unique<fake_stream>(stats, locator.empty() ? '?' : locator[0], start_frame, total, fail);
    }

    std::vector<start_call> starts() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_starts;
    }

    std::shared_ptr<stream_stats> stats = std::make_shared<stream_stats>();
    std::uint64_t                 frames_per_track = 5;
    // locator -> (frames before failing, error)
    std::map<std::string, std::pair<std::uint64_t, error_code>> failures;
    std::set<std::string>                                        refuse;

private:
    mutable std::mutex      m_mutex;
    std::vector<start_call> m_starts;
};

// ============================================================================
// Voice transport
// ============================================================================

struct transport_log {
    struct sent {
        std::uint64_t sequence;
        char          tag;
        std::chrono::steady_clock::time_point at;
    };

    mutable std::mutex mutex;
    std::vector<sent>  frames;
    int                opens  = 0;
    int                closes = 0;

    // Scripted open() results, then ok.
    std::deque<voice::transport_status> open_script;
    // Scripted send_frame() results, then ok.
    std::deque<voice::transport_status> send_script;

    std::vector<sent> sent_frames() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return frames;
    }

    std::size_t frame_count() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return frames.size();
    }

    int open_count() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return opens;
    }

    int close_count() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return closes;
    }
};

class recording_transport : public voice::voice_transport {
public:
    explicit recording_transport(std::shared_ptr<transport_log> log)
        : m_log(std::move(log))
    {
    }

    voice::transport_status open(const voice_channel&) override
    {
        std::lock_guard<std::mutex> lock(m_log->mutex);
        ++m_log->opens;
        if (m_log->open_script.empty()) {
            return voice::transport_status::ok;
        }
        const auto st = m_log->open_script.front();
        m_log->open_script.pop_front();
        return st;
    }

    voice::transport_status send_frame(const audio_frame& frame) override
    {
        std::lock_guard<std::mutex> lock(m_log->mutex);
        if (!m_log->send_script.empty()) {
            const auto st = m_log->send_script.front();
            m_log->send_script.pop_front();
            if (st != voice::transport_status::ok) {
                return st;
            }
        }
        m_log->frames.push_back({ frame.sequence, static_cast<char>(frame.payload.at(0)),
                                  std::chrono::steady_clock::now() });
        return voice::transport_status::ok;
    }

    void close() override
    {
        std::lock_guard<std::mutex> lock(m_log->mutex);
        ++m_log->closes;
    }

private:
    std::shared_ptr<transport_log> m_log;
};

// ============================================================================
// Events
// ============================================================================

class event_recorder {
public:
    event_sink sink()
    {
        return [this](const playback_event& ev) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_events.push_back(ev);
        };
    }

    std::vector<playback_event> events() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events;
    }

    std::size_t count(event_type type) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::size_t n = 0;
        for (const auto& e : m_events) {
            n += e.type == type ? 1 : 0;
        }
        return n;
    }

    // Titles of entries in events of the given type, in order.
    std::vector<std::string> titles(event_type type) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> out;
        for (const auto& e : m_events) {
            if (e.type == type && e.entry) {
                out.push_back(e.entry->track.title);
            }
        }
        return out;
    }

private:
    mutable std::mutex          m_mutex;
    std::vector<playback_event> m_events;
};

} // namespace jb::test
