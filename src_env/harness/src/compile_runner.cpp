#include "codeact_rust/compile_runner.hpp"
#include "codeact_rust/process.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

void write_source(const fs::path& path, std::string_view source) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("Failed to write file: " + path.string());
    }
    out.write(source.data(), static_cast<std::streamsize>(source.size()));
    if (!out) {
        throw std::runtime_error("Short write: " + path.string());
    }
}

}  // namespace

namespace codeact::rust {

std::string merge_stderr(std::string_view compile_stderr, std::string_view run_stderr) {
    if (!compile_stderr.empty() && !run_stderr.empty()) {
        std::string merged{compile_stderr};
        merged.push_back('\n');
        merged.append(run_stderr);
        return merged;
    }
    return std::string{compile_stderr.empty() ? run_stderr : compile_stderr};
}

CompileRunner::CompileRunner(std::shared_ptr<const Toolchain> toolchain, Config config)
    : toolchain_{std::move(toolchain)}, config_{std::move(config)} {
    if (!toolchain_) {
        throw std::invalid_argument("CompileRunner requires a toolchain");
    }
}

ExecutionResult CompileRunner::compile_only(std::string_view source) const {
    const ScratchDirectory scratch{config_.scratch_root, "codeact-rust-"};
    const fs::path source_path = scratch.path() / "main.rs";
    write_source(source_path, source);
    return toolchain_->compile(source_path, scratch.path() / "program", CompileMode::Binary,
                               config_.compile_timeout);
}

ExecutionResult CompileRunner::run_program(std::string_view source) const {
    return compile_and_run(source, CompileMode::Binary, {});
}

ExecutionResult CompileRunner::run_tests(std::string_view source) const {
    return compile_and_run(source, CompileMode::Tests, config_.test_args);
}

ExecutionResult CompileRunner::compile_and_run(std::string_view source,
                                               CompileMode mode,
                                               const std::vector<std::string>& args) const {
    const ScratchDirectory scratch{config_.scratch_root,
                                   mode == CompileMode::Tests ? "codeact-rust-tests-" : "codeact-rust-"};

    const bool tests = mode == CompileMode::Tests;
    const fs::path source_path = scratch.path() / (tests ? "lib.rs" : "main.rs");
    const fs::path binary_path = scratch.path() / (tests ? "rust_tests" : "program");
    write_source(source_path, source);

    auto compiled = toolchain_->compile(source_path, binary_path, mode, config_.compile_timeout);
    if (compiled.exit_code != 0) {
        return compiled;
    }

    auto ran = toolchain_->execute(binary_path, args, config_.run_timeout);
    return ExecutionResult{
        std::move(ran.stdout_text),
        merge_stderr(compiled.stderr_text, ran.stderr_text),
        ran.exit_code,
    };
}

}  // namespace codeact::rust
