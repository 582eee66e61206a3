#include "hook_invoker.hpp"
#include "watchdog.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hookchain {

namespace {

// Owns one file descriptor; closes it on destruction.
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    void reset() {
        if (fd_ >= 0) {
            close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

struct Pipe {
    FileDescriptor read_end;
    FileDescriptor write_end;
};

bool open_pipe(Pipe& p, std::string& err) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        err = std::string("pipe: ") + std::strerror(errno);
        return false;
    }
    p.read_end = FileDescriptor(fds[0]);
    p.write_end = FileDescriptor(fds[1]);
    return true;
}

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// Writing to a pipe whose reader is gone must come back as EPIPE, not kill us.
void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, []() { signal(SIGPIPE, SIG_IGN); });
}

void append_limited(std::string& dst, const char* src, size_t n, size_t limit, bool& truncated) {
    size_t avail = dst.size() < limit ? limit - dst.size() : 0;
    size_t take = std::min(n, avail);
    dst.append(src, take);
    if (take < n) truncated = true;
}

// Child exited (or was killed) but has not been reaped yet.
bool child_has_exited(pid_t pid) {
    siginfo_t info{};
    if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        return errno == ECHILD;
    }
    return info.si_pid == pid;
}

// Blocks until the child exits, leaving it as a zombie so its process group
// id stays reserved while the watchdog may still signal it.
void wait_for_exit(pid_t pid) {
    siginfo_t info{};
    while (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) != 0) {
        if (errno != EINTR) break;
    }
}

int reap(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            std::cerr << "[invoker] waitpid(" << pid << ") failed: " << std::strerror(errno) << "\n";
            return -1;
        }
    }
    return status;
}

// Child side of fork(): only async-signal-safe calls from here on.
[[noreturn]] void exec_child(int stdin_fd, int out_fd, char* const* argv) {
    setpgid(0, 0);
    signal(SIGPIPE, SIG_DFL);

    auto redirect = [](int from, int to) {
        if (from == to) {
            fcntl(to, F_SETFD, 0);  // dup2 would keep O_CLOEXEC
            return;
        }
        if (dup2(from, to) < 0) _exit(kNotFoundExitCode);
    };
    redirect(stdin_fd, STDIN_FILENO);
    redirect(out_fd, STDOUT_FILENO);
    redirect(out_fd, STDERR_FILENO);

    execvp(argv[0], argv);
    _exit(kNotFoundExitCode);
}

} // namespace

InvokeResult ProcessHookInvoker::invoke(const HookCommand& cmd, const std::string& input, Millis timeout) {
    InvokeResult result;
    auto started = Clock::now();
    auto finish = [&](InvokeResult& r) -> InvokeResult {
        r.elapsed = std::chrono::duration_cast<Millis>(Clock::now() - started);
        return std::move(r);
    };

    if (cmd.program.empty()) {
        result.exit_code = kNotFoundExitCode;
        result.error = "empty command";
        return finish(result);
    }

    ignore_sigpipe_once();

    // argv is built before fork; the child must not allocate
    std::vector<std::string> all = {cmd.program};
    all.insert(all.end(), cmd.args.begin(), cmd.args.end());
    std::vector<char*> argv;
    argv.reserve(all.size() + 1);
    for (auto& s : all) argv.push_back(s.data());
    argv.push_back(nullptr);

    Pipe in_pipe, out_pipe;
    if (!open_pipe(in_pipe, result.error) || !open_pipe(out_pipe, result.error)) {
        result.exit_code = -1;
        std::cerr << "[invoker] " << result.error << "\n";
        return finish(result);
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.exit_code = -1;
        result.error = std::string("fork: ") + std::strerror(errno);
        std::cerr << "[invoker] " << result.error << "\n";
        return finish(result);
    }
    if (pid == 0) {
        exec_child(in_pipe.read_end.get(), out_pipe.write_end.get(), argv.data());
    }

    // Also done in the child; whichever runs first wins. EACCES after exec is fine.
    setpgid(pid, pid);

    in_pipe.read_end.reset();
    out_pipe.write_end.reset();
    FileDescriptor& to_child = in_pipe.write_end;
    FileDescriptor& from_child = out_pipe.read_end;

    if (!set_nonblocking(to_child.get()) || !set_nonblocking(from_child.get())) {
        std::cerr << "[invoker] fcntl(O_NONBLOCK) failed: " << std::strerror(errno) << "\n";
    }
    if (input.empty()) to_child.reset();

    std::unique_ptr<Watchdog> watchdog;
    try {
        watchdog = std::make_unique<Watchdog>(pid, timeout);
    } catch (const std::system_error& e) {
        kill(-pid, SIGKILL);
        reap(pid);
        result.exit_code = -1;
        result.error = std::string("watchdog: ") + e.what();
        std::cerr << "[invoker] " << result.error << "\n";
        return finish(result);
    }

    size_t written = 0;
    char buf[4096];
    // Reads what is already buffered. Bounded, since a process the hook left
    // behind may keep writing to the pipe indefinitely.
    auto drain = [&]() {
        size_t budget = max_output_bytes_ + sizeof(buf);
        while (budget > 0) {
            ssize_t n = read(from_child.get(), buf, std::min(sizeof(buf), budget));
            if (n <= 0) break;
            budget -= static_cast<size_t>(n);
            append_limited(result.output, buf, static_cast<size_t>(n), max_output_bytes_,
                           result.output_truncated);
        }
    };

    while (from_child.valid()) {
        pollfd fds[2];
        nfds_t nfds = 1;
        fds[0] = {from_child.get(), POLLIN, 0};
        if (to_child.valid()) {
            fds[1] = {to_child.get(), POLLOUT, 0};
            nfds = 2;
        }

        int rc = poll(fds, nfds, 100);
        if (rc < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[invoker] poll failed: " << std::strerror(errno) << "\n";
            break;
        }
        if (watchdog->fired()) break;

        // The hook is done once it exits, even if something it spawned still
        // holds the pipe open.
        if (child_has_exited(pid)) {
            drain();
            break;
        }
        if (rc == 0) continue;

        if (nfds == 2 && (fds[1].revents & (POLLOUT | POLLERR | POLLHUP))) {
            ssize_t n = write(to_child.get(), input.data() + written, input.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
                if (written >= input.size()) to_child.reset();
            } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                // EPIPE: the hook closed stdin without reading it all
                to_child.reset();
            }
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t n = read(from_child.get(), buf, sizeof(buf));
            if (n > 0) {
                append_limited(result.output, buf, static_cast<size_t>(n), max_output_bytes_,
                               result.output_truncated);
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                from_child.reset();
            }
        }
    }

    to_child.reset();
    from_child.reset();

    wait_for_exit(pid);
    watchdog->disarm();
    int status = reap(pid);

    bool killed = status >= 0 && WIFSIGNALED(status) && WTERMSIG(status) == SIGKILL;
    if (watchdog->fired() && (killed || status < 0)) {
        result.outcome = Outcome::timed_out;
        result.exit_code = kTimeoutExitCode;
    } else if (status < 0) {
        result.outcome = Outcome::failed;
        result.exit_code = -1;
        result.error = "lost track of child process";
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.outcome = result.exit_code == 0 ? Outcome::success : Outcome::failed;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.outcome = Outcome::failed;
    } else {
        result.exit_code = -1;
        result.outcome = Outcome::failed;
    }
    return finish(result);
}

} // namespace hookchain
