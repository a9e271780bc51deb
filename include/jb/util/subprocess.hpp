#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <cstddef>

#include <sys/types.h>

#include "jb/util/cancel_token.hpp"

namespace jb::util {

struct exit_status {
    bool exited    = false; // normal exit (vs killed by signal)
    int  code      = -1;
    int  signal    = 0;

    bool success() const { return exited && code == 0; }
};

enum class read_status {
    data,
    timeout,
    eof,
    error
};

/// One child process with its stdout/stderr pipes. The destructor terminates
/// the child if it is still running, reaps it and closes every descriptor.
class child_process {
public:
    child_process() = default;
    ~child_process();

    child_process(const child_process&)            = delete;
    child_process& operator=(const child_process&) = delete;

    /// fork + execvp. On failure returns false and fills error; nothing is
    /// left running.
    bool spawn(const std::vector<std::string>& argv, std::string& error);

    /// Read up to len bytes of stdout, waiting at most timeout. Any stderr
    /// output seen while waiting is collected (see stderr_tail()).
    read_status read_stdout(std::uint8_t* buf, std::size_t len,
                            std::chrono::milliseconds timeout,
                            std::size_t& got);

    /// Last few KB the child wrote to stderr.
    const std::string& stderr_tail() const { return m_stderr; }

    /// Block until the child exits and return how it ended.
    exit_status wait();

    /// SIGTERM, short grace period, then SIGKILL. Idempotent.
    void terminate();

    bool  running() const { return m_pid > 0 && !m_reaped; }
    bool  terminated_by_us() const { return m_killed; }
    pid_t pid() const { return m_pid; }

private:
    void collect_stderr();
    void close_fds();

    pid_t       m_pid       = -1;
    int         m_stdout_fd = -1;
    int         m_stderr_fd = -1;
    bool        m_reaped    = false;
    bool        m_killed    = false;
    exit_status m_status;
    std::string m_stderr;
};

struct run_result {
    bool        spawned   = false;
    bool        timed_out = false;
    bool        cancelled = false;
    exit_status status;
    std::string out;
    std::string err;
};

/// Run a command to completion capturing its output, killing it on timeout
/// or when cancel is set.
run_result run_capture(const std::vector<std::string>& argv,
                       std::chrono::milliseconds timeout,
                       const cancel_token& cancel);

} // namespace jb::util
