#pragma once

#include "codeact_rust/compile_runner.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace codeact::rust {

/**
 * rustc bridge.
 *
 * Compiles single-file crates with the locally installed `rustc` and runs the
 * produced binaries as child processes:
 *
 *   rustc [--test] <source> --edition <edition> -o <output> [extra flags...]
 *   <binary> [args...]
 *
 * Each invocation has its own wall-clock bound. On expiry the child process
 * group is killed and the call reports `<what> timed out after <N>s` with exit
 * code 1 instead of throwing.
 */
class RustcToolchain final : public Toolchain {
public:
    struct Config {
        // Compiler executable, resolved through PATH when not absolute.
        std::string rustc{"rustc"};

        // Value passed to `--edition`.
        std::string edition{"2021"};

        // Extra flags appended after the output path (e.g. "-O").
        std::vector<std::string> extra_flags{};
    };

    RustcToolchain() = default;
    explicit RustcToolchain(Config cfg);

    ExecutionResult compile(const std::filesystem::path& source_file,
                            const std::filesystem::path& output_binary,
                            CompileMode mode,
                            std::chrono::seconds timeout) const override;

    ExecutionResult execute(const std::filesystem::path& binary,
                            const std::vector<std::string>& args,
                            std::chrono::seconds timeout) const override;

    /// Command line used for a compile call; exposed for diagnostics.
    [[nodiscard]] std::vector<std::string> compile_command(const std::filesystem::path& source_file,
                                                           const std::filesystem::path& output_binary,
                                                           CompileMode mode) const;

    [[nodiscard]] const Config& config() const noexcept { return cfg_; }

private:
    Config cfg_;
};

}  // namespace codeact::rust
