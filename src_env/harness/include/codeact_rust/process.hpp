#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace codeact::rust {

/**
 * \brief Captured result of a child process.
 *
 * exit_code follows the shell convention: the process's exit status when it
 * exited normally, 128 + signal number when it was killed by a signal, 127
 * when the executable could not be started.
 */
struct ProcessOutcome {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code{0};
    bool timed_out{false};
};

struct ProcessOptions {
    std::filesystem::path working_dir{};
    std::chrono::milliseconds timeout{std::chrono::seconds{10}};
    // Bytes kept per stream; the rest is drained and discarded.
    std::size_t output_limit{1u << 20};
};

/**
 * \brief Runs \a argv (argv[0] resolved through PATH) and waits for it.
 *
 * The child is placed in its own process group. When the timeout elapses the
 * whole group is killed with SIGKILL and reaped before returning, and the
 * outcome is flagged timed_out. Failures to create pipes or fork are reported
 * through the outcome (exit_code 1, explanatory stderr), never thrown.
 */
[[nodiscard]] ProcessOutcome run_process(const std::vector<std::string>& argv,
                                         const ProcessOptions& options);

/**
 * \brief Uniquely named directory that is removed, with its contents, when the
 *        owning object goes out of scope.
 */
class ScratchDirectory {
public:
    /// Creates `<root>/<prefix>XXXXXX`. An empty root means the system temp dir.
    /// Throws std::runtime_error when the directory cannot be created.
    explicit ScratchDirectory(const std::filesystem::path& root = {},
                              const std::string& prefix = "codeact-rust-");
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;
    ScratchDirectory(ScratchDirectory&& other) noexcept;
    ScratchDirectory& operator=(ScratchDirectory&& other) noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    void release() noexcept;

    std::filesystem::path path_;
};

}  // namespace codeact::rust
