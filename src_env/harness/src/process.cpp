#include "codeact_rust/process.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kPollSliceMs = 50;

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct Pipe {
    int read_end{-1};
    int write_end{-1};

    Pipe() = default;
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
    ~Pipe() {
        close_fd(read_end);
        close_fd(write_end);
    }

    bool open() {
        int fds[2];
        if (::pipe(fds) != 0) {
            return false;
        }
        read_end = fds[0];
        write_end = fds[1];
        ::fcntl(read_end, F_SETFD, FD_CLOEXEC);
        ::fcntl(write_end, F_SETFD, FD_CLOEXEC);
        return true;
    }
};

void set_nonblocking(int fd) noexcept {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Reads everything currently available. Returns false once the stream is
// finished (EOF or a hard error) so the caller can close it.
bool drain(int fd, std::string& buffer, std::size_t limit) {
    char chunk[4096];
    while (true) {
        const ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            if (buffer.size() < limit) {
                const auto keep = std::min(static_cast<std::size_t>(n), limit - buffer.size());
                buffer.append(chunk, keep);
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

// Checks for termination without reaping, so the process group id stays
// reserved until kill_group() has run.
bool child_exited(pid_t pid) {
    siginfo_t info{};
    while (true) {
        if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0) {
            return info.si_pid == pid;
        }
        if (errno != EINTR) {
            return true;
        }
    }
}

void kill_group(pid_t pid) noexcept {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}

bool reap(pid_t pid, int& status) {
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return false;
        }
    }
    return true;
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

[[noreturn]] void child_fail(const char* what, const char* subject) {
    // Only async-signal-safe calls past fork().
    [[maybe_unused]] auto n = ::write(STDERR_FILENO, what, std::strlen(what));
    n = ::write(STDERR_FILENO, subject, std::strlen(subject));
    n = ::write(STDERR_FILENO, "\n", 1);
    ::_exit(127);
}

}  // namespace

namespace codeact::rust {

ProcessOutcome run_process(const std::vector<std::string>& argv, const ProcessOptions& options) {
    ProcessOutcome outcome;
    if (argv.empty()) {
        outcome.exit_code = 127;
        outcome.stderr_text = "run_process: empty command line";
        return outcome;
    }

    Pipe out_pipe;
    Pipe err_pipe;
    if (!out_pipe.open() || !err_pipe.open()) {
        outcome.exit_code = 1;
        outcome.stderr_text = errno_message("failed to create pipes");
        return outcome;
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);
    const std::string work_dir = options.working_dir.string();

    const pid_t pid = ::fork();
    if (pid < 0) {
        outcome.exit_code = 1;
        outcome.stderr_text = errno_message("failed to fork '" + argv.front() + "'");
        return outcome;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(out_pipe.write_end, STDOUT_FILENO);
        ::dup2(err_pipe.write_end, STDERR_FILENO);
        if (!work_dir.empty() && ::chdir(work_dir.c_str()) != 0) {
            child_fail("run_process: cannot enter working directory ", work_dir.c_str());
        }
        ::execvp(c_argv[0], c_argv.data());
        child_fail("run_process: cannot execute ", c_argv[0]);
    }

    ::setpgid(pid, pid);
    close_fd(out_pipe.write_end);
    close_fd(err_pipe.write_end);
    set_nonblocking(out_pipe.read_end);
    set_nonblocking(err_pipe.read_end);

    const auto deadline = Clock::now() + options.timeout;
    int status = 0;

    while (true) {
        const auto now = Clock::now();
        if (now >= deadline) {
            kill_group(pid);
            (void)reap(pid, status);
            outcome.timed_out = true;
            outcome.exit_code = 1;
            return outcome;
        }

        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count() + 1;
        const int slice_ms = static_cast<int>(std::min<long long>(remaining, kPollSliceMs));

        pollfd fds[2];
        nfds_t count = 0;
        for (int fd : {out_pipe.read_end, err_pipe.read_end}) {
            if (fd >= 0) {
                fds[count++] = pollfd{fd, POLLIN, 0};
            }
        }

        if (count > 0) {
            if (::poll(fds, count, slice_ms) < 0 && errno != EINTR) {
                kill_group(pid);
                (void)reap(pid, status);
                outcome.exit_code = 1;
                outcome.stderr_text += errno_message("poll failed while waiting for '" + argv.front() + "'");
                return outcome;
            }
            if (out_pipe.read_end >= 0 &&
                !drain(out_pipe.read_end, outcome.stdout_text, options.output_limit)) {
                close_fd(out_pipe.read_end);
            }
            if (err_pipe.read_end >= 0 &&
                !drain(err_pipe.read_end, outcome.stderr_text, options.output_limit)) {
                close_fd(err_pipe.read_end);
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(std::min(slice_ms, 10)));
        }

        if (child_exited(pid)) {
            break;
        }
    }

    if (out_pipe.read_end >= 0) {
        (void)drain(out_pipe.read_end, outcome.stdout_text, options.output_limit);
    }
    if (err_pipe.read_end >= 0) {
        (void)drain(err_pipe.read_end, outcome.stderr_text, options.output_limit);
    }
    // Descendants left behind in the group must not outlive the call.
    kill_group(pid);

    if (!reap(pid, status)) {
        outcome.exit_code = 1;
        outcome.stderr_text += errno_message("waitpid failed for '" + argv.front() + "'");
        return outcome;
    }
    outcome.exit_code = decode_status(status);
    return outcome;
}

ScratchDirectory::ScratchDirectory(const fs::path& root, const std::string& prefix) {
    std::error_code ec;
    const fs::path base = root.empty() ? fs::temp_directory_path(ec) : root;
    if (ec) {
        throw std::runtime_error("Unable to resolve temporary directory: " + ec.message());
    }
    fs::create_directories(base, ec);
    if (ec) {
        throw std::runtime_error("Unable to create scratch root " + base.string() + ": " + ec.message());
    }

    const std::string pattern = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error(errno_message("Unable to create scratch directory under " + base.string()));
    }
    path_ = fs::path(buffer.data());
}

ScratchDirectory::~ScratchDirectory() {
    release();
}

ScratchDirectory::ScratchDirectory(ScratchDirectory&& other) noexcept
    : path_{std::exchange(other.path_, {})} {}

ScratchDirectory& ScratchDirectory::operator=(ScratchDirectory&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::exchange(other.path_, {});
    }
    return *this;
}

void ScratchDirectory::release() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    path_.clear();
}

}  // namespace codeact::rust
