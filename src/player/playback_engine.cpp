#include "jb/player/playback_engine.hpp"

#include <algorithm>
#include <sstream>

namespace jb::player {

namespace {

constexpr std::chrono::milliseconds locate_poll{ 10 };
constexpr std::chrono::milliseconds underrun_retry{ 5 };

} // namespace

playback_engine::playback_engine(dpp::snowflake session_id,
                                 voice_channel channel,
                                 engine_deps deps,
                                 engine_config cfg)
    : m_session_id(session_id)
    , m_channel(channel)
    , m_deps(std::move(deps))
    , m_cfg(cfg)
    , m_queue(session_id)
{
    if (!m_deps.log) {
        m_deps.log = [](dpp::loglevel, const std::string&) {};
    }
    m_idle_since = clock::now();
    m_thread     = std::thread(&playback_engine::run, this);
}

playback_engine::~playback_engine()
{
    if (m_thread.joinable()) {
        post([this] {
            if (!m_exit) {
                teardown(end_reason::stopped);
            }
        });
        m_thread.join();
    }
    // Abandoned locates were cancelled; their futures block here until done.
    m_abandoned.clear();
}

// ---------- Mailbox ----------

template <typename R>
R playback_engine::call(std::function<R()> fn, R if_closed)
{
    if (std::this_thread::get_id() == m_thread.get_id()) {
        return fn();
    }

    auto job = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    auto fut = job->get_future();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return if_closed;
        }
        m_mailbox.push_back([job] { (*job)(); });
    }
    m_cv.notify_all();
    return fut.get();
}

void playback_engine::post(task t)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return;
        }
        m_mailbox.push_back(std::move(t));
    }
    m_cv.notify_all();
}

// ---------- Commands ----------

command_result playback_engine::open()
{
    return call<command_result>([this] {
        if (m_queue.mode() == session_mode::stopping) {
            return command_result::failure(error_code::invalid_state, "Session is stopping");
        }
        if (m_deps.transport->open(m_channel) != voice::transport_status::ok) {
            return command_result::failure(error_code::transport_disconnected, "Could not connect to voice");
        }
        m_transport_up  = true;
        m_next_deadline = clock::now();
        return command_result::success();
    }, command_result::failure(error_code::session_not_found));
}

command_result playback_engine::enqueue(std::vector<resolved_track> tracks)
{
    return call<command_result>([this, tracks = std::move(tracks)]() mutable {
        return do_enqueue(tracks);
    }, command_result::failure(error_code::session_not_found));
}

command_result playback_engine::skip()
{
    return call<command_result>([this] { return do_skip(); },
                                command_result::failure(error_code::session_not_found));
}

command_result playback_engine::pause()
{
    return call<command_result>([this] { return do_pause(); },
                                command_result::failure(error_code::session_not_found));
}

command_result playback_engine::resume()
{
    return call<command_result>([this] { return do_resume(); },
                                command_result::failure(error_code::session_not_found));
}

command_result playback_engine::remove(std::uint64_t entry_id)
{
    return call<command_result>([this, entry_id] { return do_remove(entry_id); },
                                command_result::failure(error_code::session_not_found));
}

command_result playback_engine::move(std::uint64_t entry_id, std::size_t position)
{
    return call<command_result>([this, entry_id, position] {
        if (m_queue.mode() == session_mode::stopping) {
            return command_result::failure(error_code::invalid_state, "Session is stopping");
        }
        return m_queue.move(entry_id, position);
    }, command_result::failure(error_code::session_not_found));
}

queue_snapshot playback_engine::list_queue()
{
    queue_snapshot closed;
    closed.session_id = m_session_id;
    closed.mode       = session_mode::stopping;

    return call<queue_snapshot>([this] {
        auto s     = m_queue.snapshot();
        s.position = std::chrono::milliseconds(
            static_cast<std::int64_t>(m_frames_sent) * frame_duration.count());
        return s;
    }, closed);
}

command_result playback_engine::stop()
{
    return call<command_result>([this] {
        if (m_exit) {
            return command_result::failure(error_code::invalid_state, "Session is stopping");
        }
        teardown(end_reason::stopped);
        return command_result::success();
    }, command_result::failure(error_code::session_not_found));
}

void playback_engine::notify_transport_lost()
{
    post([this] { transport_lost(clock::now()); });
}

command_result playback_engine::do_enqueue(std::vector<resolved_track>& tracks)
{
    if (m_queue.mode() == session_mode::stopping) {
        return command_result::failure(error_code::invalid_state, "Session is stopping");
    }

    command_result res;
    for (auto& t : tracks) {
        res.entry_ids.push_back(m_queue.append(std::move(t)));
    }

    std::ostringstream oss;
    oss << "Queued " << res.entry_ids.size() << " track(s) for guild " << m_session_id
        << ", " << m_queue.upcoming().size() << " waiting";
    log(dpp::ll_info, oss.str());

    if (m_queue.mode() == session_mode::idle) {
        start_next_track(clock::now());
    }
    return res;
}

command_result playback_engine::do_skip()
{
    if (!m_queue.current()) {
        return command_result::failure(error_code::invalid_state, "Nothing playing");
    }
    log(dpp::ll_info, "Skip requested for guild " + m_session_id.str());
    end_track(end_reason::skipped, error_code::none, {});
    return command_result::success();
}

command_result playback_engine::do_pause()
{
    auto r = m_queue.pause();
    if (r.ok()) {
        m_paused_at = clock::now();
        log(dpp::ll_info, "Paused guild " + m_session_id.str());
    }
    return r;
}

command_result playback_engine::do_resume()
{
    auto r = m_queue.resume();
    if (!r.ok()) {
        return r;
    }

    log(dpp::ll_info, "Resumed guild " + m_session_id.str());
    m_next_deadline = clock::now();
    if (m_phase == track_phase::released && m_queue.current()) {
        // The old media URL may have expired while paused; locate again.
        begin_locate(m_queue.current()->entry);
    }
    return r;
}

command_result playback_engine::do_remove(std::uint64_t entry_id)
{
    if (m_queue.mode() == session_mode::stopping) {
        return command_result::failure(error_code::invalid_state, "Session is stopping");
    }

    switch (m_queue.remove(entry_id)) {
    case remove_outcome::removed:
        return command_result::success();
    case remove_outcome::is_current:
        end_track(end_reason::removed, error_code::none, {});
        return command_result::success();
    case remove_outcome::not_found:
        break;
    }
    return command_result::failure(error_code::entry_not_found);
}

// ---------- Loop ----------

void playback_engine::run()
{
    while (true) {
        std::deque<task> batch;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            const auto wake     = next_wakeup(clock::now());
            const auto has_mail = [this] { return !m_mailbox.empty(); };
            if (wake) {
                m_cv.wait_until(lock, *wake, has_mail);
            } else {
                m_cv.wait(lock, has_mail);
            }
            batch.swap(m_mailbox);
        }

        for (auto& t : batch) {
            t();
        }
        if (m_exit) {
            break;
        }

        step(clock::now());
        if (m_exit) {
            break;
        }
    }

    // Answer whatever was still queued; those commands see Stopping.
    std::deque<task> leftovers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
        leftovers.swap(m_mailbox);
    }
    for (auto& t : leftovers) {
        t();
    }

    m_terminated.store(true);
    log(dpp::ll_debug, "Engine loop ended for guild " + m_session_id.str());
}

std::optional<playback_engine::clock::time_point> playback_engine::next_wakeup(clock::time_point now) const
{
    std::optional<clock::time_point> wake;
    const auto consider = [&wake](clock::time_point t) {
        if (!wake || t < *wake) {
            wake = t;
        }
    };

    if (m_reconnecting) {
        consider(m_next_reconnect);
    }
    if (m_phase == track_phase::locating || !m_abandoned.empty()) {
        consider(now + locate_poll);
    }
    if (m_phase == track_phase::streaming) {
        if (m_queue.mode() == session_mode::playing && m_transport_up) {
            consider(m_next_deadline);
        } else if (m_queue.mode() == session_mode::paused) {
            consider(m_paused_at + m_cfg.pause_timeout);
        }
    }
    return wake;
}

void playback_engine::step(clock::time_point now)
{
    reap_abandoned();

    if (m_reconnecting) {
        try_reconnect(now);
        if (m_exit) {
            return;
        }
    }

    if (m_phase == track_phase::locating) {
        poll_locate(now);
    }

    if (m_phase != track_phase::streaming) {
        return;
    }

    if (m_queue.mode() == session_mode::playing && m_transport_up) {
        pump_frames(now);
    } else if (m_queue.mode() == session_mode::paused && now - m_paused_at >= m_cfg.pause_timeout) {
        // Paused too long: give the decoder back, keep the position.
        std::ostringstream oss;
        oss << "Pause timeout for guild " << m_session_id
            << ", releasing decoder at frame " << m_frames_sent;
        log(dpp::ll_info, oss.str());

        m_stream->stop();
        m_stream.reset();
        m_phase = track_phase::released;
    }
}

void playback_engine::start_next_track(clock::time_point now)
{
    m_frames_sent = 0;

    auto entry = m_queue.advance(now);
    if (!entry) {
        set_idle(true, now);

        playback_event ev;
        ev.type = event_type::queue_empty;
        emit(std::move(ev));
        return;
    }

    set_idle(false, now);

    {
        std::ostringstream oss;
        oss << "Starting entry " << entry->id << " '" << entry->track.title
            << "' for guild " << m_session_id;
        log(dpp::ll_info, oss.str());
    }

    playback_event ev;
    ev.type  = event_type::track_started;
    ev.entry = *entry;
    emit(std::move(ev));

    begin_locate(*entry);
}

void playback_engine::begin_locate(const queue_entry& entry)
{
    m_locate_cancel = util::cancel_token{};
    m_phase         = track_phase::locating;

    auto locator = m_deps.locator;
    auto token   = m_locate_cancel;
    try {
        m_locate = std::async(std::launch::async, [locator, track = entry.track, token] {
            return locator->locate(track, token);
        });
    } catch (const std::system_error& e) {
        // Report through the normal path on the next step.
        resolve::locate_result failed;
        failed.code          = error_code::locate_provider_unavailable;
        failed.error_message = std::string("could not start locate: ") + e.what();

        std::promise<resolve::locate_result> p;
        p.set_value(std::move(failed));
        m_locate = p.get_future();
    }
}

void playback_engine::poll_locate(clock::time_point now)
{
    if (m_locate.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return;
    }

    const auto located = m_locate.get();
    if (!located.ok()) {
        end_track(end_reason::locate_error, located.code, located.error_message);
        return;
    }

    std::string error;
    m_stream = m_deps.transcoder->start(located.source, m_frames_sent, error);
    if (!m_stream) {
        end_track(end_reason::decode_error, error_code::decode_process_failed, error);
        return;
    }

    m_phase         = track_phase::streaming;
    m_next_deadline = now;
}

void playback_engine::pump_frames(clock::time_point now)
{
    if (now < m_next_deadline) {
        return;
    }

    audio_frame         f;
    audio::frame_status status = audio::frame_status::frame;
    if (m_held) {
        f = std::move(*m_held);
        m_held.reset();
    } else {
        status = m_stream->next(f, std::chrono::milliseconds(0));
    }

    switch (status) {
    case audio::frame_status::frame: {
        const auto st = m_deps.transport->send_frame(f);
        if (st == voice::transport_status::disconnected) {
            m_held = std::move(f);
            transport_lost(now);
            return;
        }
        m_frames_sent = f.sequence + 1;

        if (st == voice::transport_status::send_failed) {
            if (++m_send_failures >= m_cfg.max_send_failures) {
                playback_event ev;
                ev.type    = event_type::error;
                ev.entry   = m_queue.current() ? std::optional<queue_entry>(m_queue.current()->entry) : std::nullopt;
                ev.error   = error_code::transport_send_failed;
                ev.message = "Sending audio keeps failing";
                emit(std::move(ev));
                m_send_failures = 0;
                transport_lost(now);
                return;
            }
        } else {
            m_send_failures = 0;
        }

        // Next frame one interval later; after a stall, do not burst to catch up.
        m_next_deadline += m_cfg.frame_interval;
        if (m_next_deadline < now) {
            m_next_deadline = now;
        }
        break;
    }
    case audio::frame_status::pending:
        m_next_deadline = now + underrun_retry;
        break;
    case audio::frame_status::end_of_stream:
        end_track(end_reason::finished, error_code::none, {});
        break;
    case audio::frame_status::decode_error: {
        const auto code    = m_stream->error();
        const auto message = m_stream->error_message();
        end_track(end_reason::decode_error, code, message);
        break;
    }
    }
}

void playback_engine::end_track(end_reason reason, error_code error, const std::string& message)
{
    std::optional<queue_entry> entry;
    if (m_queue.current()) {
        entry = m_queue.current()->entry;
    }

    cancel_active();

    {
        std::ostringstream oss;
        oss << "Track ended (" << to_string(reason) << ") for guild " << m_session_id;
        if (entry) {
            oss << ": entry " << entry->id << " '" << entry->track.title << "'";
        }
        if (error != error_code::none) {
            oss << " - " << to_string(error) << ": " << message;
        }
        log(error == error_code::none ? dpp::ll_info : dpp::ll_warning, oss.str());
    }

    playback_event ended;
    ended.type    = event_type::track_ended;
    ended.entry   = entry;
    ended.reason  = reason;
    ended.error   = error;
    ended.message = message;
    emit(ended);

    if (error != error_code::none) {
        playback_event err = ended;
        err.type = event_type::error;
        emit(std::move(err));
    }

    start_next_track(clock::now());
}

void playback_engine::cancel_active()
{
    if (m_stream) {
        m_stream->stop();
        m_stream.reset();
    }
    m_held.reset();
    if (m_locate.valid()) {
        m_locate_cancel.cancel();
        m_abandoned.push_back(std::move(m_locate));
    }
    m_phase = track_phase::none;
}

void playback_engine::reap_abandoned()
{
    m_abandoned.erase(
        std::remove_if(m_abandoned.begin(), m_abandoned.end(), [](std::future<resolve::locate_result>& f) {
            return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }),
        m_abandoned.end());
}

// ---------- Transport ----------

void playback_engine::transport_lost(clock::time_point now)
{
    if (m_reconnecting || m_exit) {
        return;
    }

    m_transport_up      = false;
    m_reconnecting      = true;
    m_reconnect_attempt = 0;
    m_next_reconnect    = now + m_cfg.reconnect_base_delay;

    log(dpp::ll_warning, "Voice transport lost for guild " + m_session_id.str() + ", reconnecting");
}

void playback_engine::try_reconnect(clock::time_point now)
{
    if (now < m_next_reconnect) {
        return;
    }

    ++m_reconnect_attempt;
    {
        std::ostringstream oss;
        oss << "Reconnect attempt " << m_reconnect_attempt << "/" << m_cfg.reconnect_attempts
            << " for guild " << m_session_id;
        log(dpp::ll_info, oss.str());
    }

    if (m_deps.transport->open(m_channel) == voice::transport_status::ok) {
        m_transport_up  = true;
        m_reconnecting  = false;
        m_send_failures = 0;
        m_next_deadline = clock::now();
        log(dpp::ll_info, "Voice transport restored for guild " + m_session_id.str());
        return;
    }

    if (m_reconnect_attempt >= m_cfg.reconnect_attempts) {
        std::ostringstream oss;
        oss << "Voice connection lost after " << m_reconnect_attempt << " reconnect attempts";
        log(dpp::ll_error, oss.str() + " for guild " + m_session_id.str());

        playback_event ev;
        ev.type    = event_type::error;
        ev.error   = error_code::transport_disconnected;
        ev.message = oss.str();
        emit(std::move(ev));

        teardown(end_reason::transport_error);
        return;
    }

    m_next_reconnect = clock::now() + m_cfg.reconnect_base_delay * (1 << m_reconnect_attempt);
}

void playback_engine::teardown(end_reason reason)
{
    std::optional<queue_entry> entry;
    if (m_queue.current()) {
        entry = m_queue.current()->entry;
    }

    cancel_active();
    m_queue.begin_stopping();

    if (entry) {
        playback_event ev;
        ev.type   = event_type::track_ended;
        ev.entry  = entry;
        ev.reason = reason;
        emit(std::move(ev));
    }

    m_deps.transport->close();
    m_transport_up = false;
    m_reconnecting = false;
    m_exit         = true;
    set_idle(false, clock::now());

    log(dpp::ll_info, "Session stopped for guild " + m_session_id.str());
}

// ---------- Helpers ----------

std::optional<std::chrono::steady_clock::time_point> playback_engine::idle_since() const
{
    std::lock_guard<std::mutex> lock(m_idle_mutex);
    return m_idle_since;
}

void playback_engine::set_idle(bool idle, clock::time_point now)
{
    std::lock_guard<std::mutex> lock(m_idle_mutex);
    if (!idle) {
        m_idle_since.reset();
    } else if (!m_idle_since) {
        m_idle_since = now;
    }
}

void playback_engine::emit(playback_event ev)
{
    if (!m_deps.events) {
        return;
    }
    ev.session_id = m_session_id;
    try {
        m_deps.events(ev);
    } catch (const std::exception& e) {
        log(dpp::ll_error, std::string("Event handler threw: ") + e.what());
    }
}

void playback_engine::log(dpp::loglevel level, const std::string& msg) const
{
    m_deps.log(level, msg);
}

} // namespace jb::player
