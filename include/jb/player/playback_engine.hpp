#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "jb/audio/frame_stream.hpp"
#include "jb/player/session_queue.hpp"
#include "jb/resolve/media_locator.hpp"
#include "jb/util/cancel_token.hpp"
#include "jb/voice/voice_transport.hpp"

namespace jb::player {

struct engine_config {
    std::chrono::milliseconds pause_timeout{ 300000 };
    int                       reconnect_attempts = 3;
    std::chrono::milliseconds reconnect_base_delay{ 1000 };
    std::chrono::milliseconds frame_interval = frame_duration;
    int                       max_send_failures = 50; // consecutive, before treating as a disconnect
};

struct engine_deps {
    std::shared_ptr<resolve::media_locator>  locator;
    std::shared_ptr<audio::transcoder>       transcoder;
    std::unique_ptr<voice::voice_transport>  transport;
    event_sink                               events;
    log_sink                                 log;
};

/// Playback for one voice session.
///
/// All state lives on the engine's own thread. Public methods post a message
/// to that thread and wait for its answer, so commands apply in submission
/// order and never race the frame loop. That thread is also the only one
/// that paces and sends frames: one frame per frame_interval against a
/// steady-clock deadline.
///
/// The event sink runs on the engine thread and must not call back into the
/// engine synchronously.
class playback_engine {
public:
    playback_engine(dpp::snowflake session_id,
                    voice_channel channel,
                    engine_deps deps,
                    engine_config cfg = {});
    ~playback_engine();

    playback_engine(const playback_engine&)            = delete;
    playback_engine& operator=(const playback_engine&) = delete;

    /// Connect the voice transport.
    command_result open();

    command_result enqueue(std::vector<resolved_track> tracks);
    command_result skip();
    command_result pause();
    command_result resume();
    command_result remove(std::uint64_t entry_id);
    command_result move(std::uint64_t entry_id, std::size_t position);
    queue_snapshot list_queue();

    /// Stop playback, drop the queue, close the transport and end the loop.
    command_result stop();

    /// Gateway reports the voice connection is gone. Does not wait.
    void notify_transport_lost();

    /// The loop has ended (stop or reconnect exhaustion).
    bool terminated() const { return m_terminated.load(); }

    /// When the session last became Idle, if it is Idle.
    std::optional<std::chrono::steady_clock::time_point> idle_since() const;

    dpp::snowflake session_id() const { return m_session_id; }
    voice_channel  channel() const { return m_channel; }

private:
    enum class track_phase {
        none,
        locating,
        streaming,
        released   // pipeline dropped after a long pause
    };

    using task = std::function<void()>;
    using clock = std::chrono::steady_clock;

    template <typename R>
    R call(std::function<R()> fn, R if_closed);
    void post(task t);

    void run();
    void step(clock::time_point now);
    std::optional<clock::time_point> next_wakeup(clock::time_point now) const;

    void start_next_track(clock::time_point now);
    void begin_locate(const queue_entry& entry);
    void poll_locate(clock::time_point now);
    void pump_frames(clock::time_point now);
    void end_track(end_reason reason, error_code error, const std::string& message);
    void cancel_active();
    void reap_abandoned();

    void transport_lost(clock::time_point now);
    void try_reconnect(clock::time_point now);
    void teardown(end_reason reason);

    void set_idle(bool idle, clock::time_point now);
    void emit(playback_event ev);
    void log(dpp::loglevel level, const std::string& msg) const;

    command_result do_enqueue(std::vector<resolved_track>& tracks);
    command_result do_skip();
    command_result do_pause();
    command_result do_resume();
    command_result do_remove(std::uint64_t entry_id);

    const dpp::snowflake m_session_id;
    const voice_channel  m_channel;
    engine_deps          m_deps;
    const engine_config  m_cfg;

    // Owned by the engine thread.
    session_queue                                    m_queue;
    track_phase                                      m_phase = track_phase::none;
    std::unique_ptr<audio::frame_stream>             m_stream;
    std::optional<audio_frame>                       m_held; // not delivered, transport was down
    std::future<resolve::locate_result>              m_locate;
    util::cancel_token                               m_locate_cancel;
    std::vector<std::future<resolve::locate_result>> m_abandoned;
    std::uint64_t                                    m_frames_sent = 0;
    clock::time_point                                m_next_deadline;
    clock::time_point                                m_paused_at;
    bool                                             m_transport_up = false;
    bool                                             m_reconnecting = false;
    int                                              m_reconnect_attempt = 0;
    clock::time_point                                m_next_reconnect;
    int                                              m_send_failures = 0;
    bool                                             m_exit = false;

    // Mailbox.
    std::mutex              m_mutex;
    std::condition_variable m_cv;
    std::deque<task>        m_mailbox;
    bool                    m_closed = false;

    mutable std::mutex               m_idle_mutex;
    std::optional<clock::time_point> m_idle_since;

    std::atomic<bool> m_terminated{ false };
    std::thread       m_thread;
};

} // namespace jb::player
