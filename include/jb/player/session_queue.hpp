#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>

#include "jb/core/types.hpp"

namespace jb::player {

struct now_playing {
    queue_entry                           entry;
    std::chrono::steady_clock::time_point started_at;
};

struct queue_snapshot {
    dpp::snowflake             session_id;
    session_mode               mode = session_mode::idle;
    std::optional<now_playing> current;
    std::chrono::milliseconds  position{ 0 }; // of the current track
    std::vector<queue_entry>   upcoming;
};

enum class remove_outcome {
    removed,
    is_current,
    not_found
};

/// Queue and playback state of one session. Not thread safe: it belongs to
/// the session's control loop.
class session_queue {
public:
    explicit session_queue(dpp::snowflake session_id);

    /// Append to the back; returns the new entry id (unique for the
    /// session's lifetime).
    std::uint64_t append(resolved_track track);

    /// Make the next entry current. With nothing left the session goes Idle
    /// and nullopt is returned.
    std::optional<queue_entry> advance(std::chrono::steady_clock::time_point now);

    remove_outcome remove(std::uint64_t entry_id);
    command_result move(std::uint64_t entry_id, std::size_t position);

    command_result pause();
    command_result resume();

    /// Enter Stopping: nothing current, nothing queued, no way back.
    void begin_stopping();

    session_mode                      mode() const { return m_mode; }
    const std::optional<now_playing>& current() const { return m_current; }
    const std::deque<queue_entry>&    upcoming() const { return m_upcoming; }
    dpp::snowflake                    session_id() const { return m_session_id; }

    queue_snapshot snapshot() const;

private:
    dpp::snowflake             m_session_id;
    std::uint64_t              m_next_id = 1;
    std::deque<queue_entry>    m_upcoming;
    std::optional<now_playing> m_current;
    session_mode               m_mode = session_mode::idle;
};

} // namespace jb::player
