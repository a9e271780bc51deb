#include "jb/util/subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace jb::util {

namespace {

constexpr std::size_t stderr_keep_bytes = 4096;

void close_fd(int& fd)
{
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

exit_status decode_wait_status(int st)
{
    exit_status s;
    if (WIFEXITED(st)) {
        s.exited = true;
        s.code   = WEXITSTATUS(st);
    } else if (WIFSIGNALED(st)) {
        s.exited = false;
        s.signal = WTERMSIG(st);
    }
    return s;
}

} // namespace

child_process::~child_process()
{
    terminate();
    close_fds();
}

bool child_process::spawn(const std::vector<std::string>& argv, std::string& error)
{
    if (argv.empty()) {
        error = "empty command line";
        return false;
    }

    int out_pipe[2]  = { -1, -1 };
    int err_pipe[2]  = { -1, -1 };
    int exec_pipe[2] = { -1, -1 };

    if (::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(exec_pipe, O_CLOEXEC) != 0)
    {
        error = std::string("pipe: ") + std::strerror(errno);
        for (int* p : { out_pipe, err_pipe, exec_pipe }) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return false;
    }

    // Build argv before fork; the child must not allocate.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        error = std::string("fork: ") + std::strerror(errno);
        for (int* p : { out_pipe, err_pipe, exec_pipe }) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return false;
    }

    if (pid == 0) {
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        ::execvp(args[0], args.data());

        const int e = errno;
        ssize_t ignored = ::write(exec_pipe[1], &e, sizeof(e));
        (void)ignored;
        ::_exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // exec_pipe closes on successful exec; otherwise the child sends errno.
    int     exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int st = 0;
        while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {
        }
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        error = "exec " + argv.front() + ": " + std::strerror(exec_errno);
        return false;
    }

    m_pid       = pid;
    m_stdout_fd = out_pipe[0];
    m_stderr_fd = err_pipe[0];
    m_reaped    = false;
    m_killed    = false;
    m_stderr.clear();
    return true;
}

void child_process::collect_stderr()
{
    if (m_stderr_fd < 0) {
        return;
    }

    char    buf[1024];
    ssize_t n = ::read(m_stderr_fd, buf, sizeof(buf));
    if (n > 0) {
        m_stderr.append(buf, static_cast<std::size_t>(n));
        if (m_stderr.size() > stderr_keep_bytes) {
            m_stderr.erase(0, m_stderr.size() - stderr_keep_bytes);
        }
    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        close_fd(m_stderr_fd);
    }
}

read_status child_process::read_stdout(std::uint8_t* buf, std::size_t len,
                                       std::chrono::milliseconds timeout,
                                       std::size_t& got)
{
    got = 0;
    if (m_stdout_fd < 0) {
        return read_status::eof;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        pollfd fds[2];
        fds[0].fd      = m_stdout_fd;
        fds[0].events  = POLLIN;
        fds[0].revents = 0;
        fds[1].fd      = m_stderr_fd; // negative fds are ignored by poll
        fds[1].events  = POLLIN;
        fds[1].revents = 0;

        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        const int wait_ms = left.count() > 0 ? static_cast<int>(left.count()) : 0;

        const int ready = ::poll(fds, 2, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return read_status::error;
        }
        if (ready == 0) {
            return read_status::timeout;
        }

        if (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) {
            collect_stderr();
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            const ssize_t n = ::read(m_stdout_fd, buf, len);
            if (n > 0) {
                got = static_cast<std::size_t>(n);
                return read_status::data;
            }
            if (n == 0) {
                close_fd(m_stdout_fd);
                return read_status::eof;
            }
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return read_status::error;
        }
    }
}

exit_status child_process::wait()
{
    if (m_pid <= 0 || m_reaped) {
        return m_status;
    }

    int st = 0;
    while (::waitpid(m_pid, &st, 0) < 0) {
        if (errno != EINTR) {
            m_reaped = true;
            return m_status;
        }
    }
    m_reaped = true;
    m_status = decode_wait_status(st);

    // Whatever is left on stderr is already written; pick it up.
    while (m_stderr_fd >= 0) {
        pollfd p{ m_stderr_fd, POLLIN, 0 };
        if (::poll(&p, 1, 0) <= 0) {
            break;
        }
        collect_stderr();
    }
    return m_status;
}

void child_process::terminate()
{
    if (!running()) {
        return;
    }

    m_killed = true;
    ::kill(m_pid, SIGTERM);

    for (int i = 0; i < 25; ++i) {
        int         st = 0;
        const pid_t r  = ::waitpid(m_pid, &st, WNOHANG);
        if (r == m_pid) {
            m_reaped = true;
            m_status = decode_wait_status(st);
            return;
        }
        if (r < 0 && errno != EINTR) {
            m_reaped = true;
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    ::kill(m_pid, SIGKILL);
    wait();
}

void child_process::close_fds()
{
    close_fd(m_stdout_fd);
    close_fd(m_stderr_fd);
}

run_result run_capture(const std::vector<std::string>& argv,
                       std::chrono::milliseconds timeout,
                       const cancel_token& cancel)
{
    run_result res;

    child_process child;
    std::string   error;
    if (!child.spawn(argv, error)) {
        res.err = error;
        return res;
    }
    res.spawned = true;

    const auto   deadline = std::chrono::steady_clock::now() + timeout;
    std::uint8_t buf[4096];

    while (true) {
        if (cancel.cancelled()) {
            res.cancelled = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            res.timed_out = true;
            break;
        }

        std::size_t got = 0;
        const auto  rs  = child.read_stdout(buf, sizeof(buf), std::chrono::milliseconds(50), got);
        if (rs == read_status::data) {
            res.out.append(reinterpret_cast<const char*>(buf), got);
        } else if (rs == read_status::eof || rs == read_status::error) {
            break;
        }
    }

    if (res.cancelled || res.timed_out) {
        child.terminate();
    }
    res.status = child.wait();
    res.err    = child.stderr_tail();
    return res;
}

} // namespace jb::util
