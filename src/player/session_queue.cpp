#include "jb/player/session_queue.hpp"

#include <algorithm>

namespace jb::player {

session_queue::session_queue(dpp::snowflake session_id)
    : m_session_id(session_id)
{
}

std::uint64_t session_queue::append(resolved_track track)
{
    queue_entry e;
    e.id    = m_next_id++;
    e.track = std::move(track);
    m_upcoming.push_back(std::move(e));
    return m_upcoming.back().id;
}

std::optional<queue_entry> session_queue::advance(std::chrono::steady_clock::time_point now)
{
    if (m_mode == session_mode::stopping) {
        return std::nullopt;
    }

    if (m_upcoming.empty()) {
        m_current.reset();
        m_mode = session_mode::idle;
        return std::nullopt;
    }

    m_current = now_playing{ std::move(m_upcoming.front()), now };
    m_upcoming.pop_front();
    m_mode = session_mode::playing;
    return m_current->entry;
}

remove_outcome session_queue::remove(std::uint64_t entry_id)
{
    if (m_current && m_current->entry.id == entry_id) {
        return remove_outcome::is_current;
    }

    auto it = std::find_if(m_upcoming.begin(), m_upcoming.end(),
                           [entry_id](const queue_entry& e) { return e.id == entry_id; });
    if (it == m_upcoming.end()) {
        return remove_outcome::not_found;
    }
    m_upcoming.erase(it);
    return remove_outcome::removed;
}

command_result session_queue::move(std::uint64_t entry_id, std::size_t position)
{
    if (m_current && m_current->entry.id == entry_id) {
        return command_result::failure(error_code::invalid_state, "The playing track cannot be moved");
    }

    auto it = std::find_if(m_upcoming.begin(), m_upcoming.end(),
                           [entry_id](const queue_entry& e) { return e.id == entry_id; });
    if (it == m_upcoming.end()) {
        return command_result::failure(error_code::entry_not_found);
    }

    queue_entry e = std::move(*it);
    m_upcoming.erase(it);

    const std::size_t at = std::min(position, m_upcoming.size());
    m_upcoming.insert(m_upcoming.begin() + static_cast<std::ptrdiff_t>(at), std::move(e));
    return command_result::success();
}

command_result session_queue::pause()
{
    if (m_mode != session_mode::playing) {
        return command_result::failure(error_code::invalid_state, "Nothing playing");
    }
    m_mode = session_mode::paused;
    return command_result::success();
}

command_result session_queue::resume()
{
    if (m_mode != session_mode::paused) {
        return command_result::failure(error_code::invalid_state, "Not paused");
    }
    m_mode = session_mode::playing;
    return command_result::success();
}

void session_queue::begin_stopping()
{
    m_mode = session_mode::stopping;
    m_current.reset();
    m_upcoming.clear();
}

queue_snapshot session_queue::snapshot() const
{
    queue_snapshot s;
    s.session_id = m_session_id;
    s.mode       = m_mode;
    s.current    = m_current;
    s.upcoming.assign(m_upcoming.begin(), m_upcoming.end());
    return s;
}

} // namespace jb::player
