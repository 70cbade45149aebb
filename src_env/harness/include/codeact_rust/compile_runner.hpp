#pragma once

#include "types.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace codeact::rust {

enum class CompileMode {
    Binary,  ///< Regular executable with `fn main`.
    Tests,   ///< Test harness executable (the toolchain's "build tests" flag).
};

/**
 * \brief Capability interface over the compiler and the produced binaries.
 *
 * Implementations must fold every expected failure (non-zero exit, timeout,
 * missing executable) into the returned ExecutionResult. A timeout yields an
 * empty stdout, a stderr naming the exceeded bound and exit code 1, and the
 * child must not outlive the call.
 */
class Toolchain {
public:
    virtual ~Toolchain() = default;

    virtual ExecutionResult compile(const std::filesystem::path& source_file,
                                    const std::filesystem::path& output_binary,
                                    CompileMode mode,
                                    std::chrono::seconds timeout) const = 0;

    virtual ExecutionResult execute(const std::filesystem::path& binary,
                                    const std::vector<std::string>& args,
                                    std::chrono::seconds timeout) const = 0;
};

/**
 * \brief Joins compiler-phase and run-phase stderr.
 *
 * Both non-empty: joined with a newline. Otherwise whichever is non-empty.
 */
[[nodiscard]] std::string merge_stderr(std::string_view compile_stderr, std::string_view run_stderr);

/**
 * \brief Compiles and runs generated sources in disposable scratch directories.
 *
 * Every call creates its own ScratchDirectory, which is removed on every exit
 * path, so concurrent callers never share files.
 */
class CompileRunner {
public:
    struct Config {
        std::chrono::seconds compile_timeout{10};
        std::chrono::seconds run_timeout{10};
        std::vector<std::string> test_args{"--nocapture"};
        std::filesystem::path scratch_root{};
    };

    CompileRunner(std::shared_ptr<const Toolchain> toolchain, Config config);

    /**
     * \brief Compiles \a source as a regular program without running it and
     *        returns the compiler's result.
     */
    [[nodiscard]] ExecutionResult compile_only(std::string_view source) const;

    /**
     * \brief Compiles \a source as a regular program and runs it without
     *        arguments. Returns the compiler result when compilation fails.
     */
    [[nodiscard]] ExecutionResult run_program(std::string_view source) const;

    /**
     * \brief Compiles \a source in test mode and runs the test binary with the
     *        configured test arguments.
     */
    [[nodiscard]] ExecutionResult run_tests(std::string_view source) const;

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    [[nodiscard]] ExecutionResult compile_and_run(std::string_view source,
                                                  CompileMode mode,
                                                  const std::vector<std::string>& args) const;

    std::shared_ptr<const Toolchain> toolchain_;
    Config config_;
};

}  // namespace codeact::rust
