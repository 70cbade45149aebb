#include "codeact_rust/rustc_toolchain.hpp"
#include "codeact_rust/process.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace codeact::rust {

namespace {

std::string timeout_message(const std::string& what, std::chrono::seconds timeout) {
    return what + " timed out after " + std::to_string(timeout.count()) + "s";
}

ExecutionResult to_execution_result(ProcessOutcome outcome,
                                    const std::string& what,
                                    std::chrono::seconds timeout) {
    if (outcome.timed_out) {
        return ExecutionResult{"", timeout_message(what, timeout), 1};
    }
    return ExecutionResult{std::move(outcome.stdout_text),
                           std::move(outcome.stderr_text),
                           outcome.exit_code};
}

}  // namespace

RustcToolchain::RustcToolchain(Config cfg) : cfg_{std::move(cfg)} {}

std::vector<std::string> RustcToolchain::compile_command(const fs::path& source_file,
                                                         const fs::path& output_binary,
                                                         CompileMode mode) const {
    std::vector<std::string> argv{cfg_.rustc};
    if (mode == CompileMode::Tests) {
        argv.emplace_back("--test");
    }
    argv.push_back(source_file.string());
    argv.emplace_back("--edition");
    argv.push_back(cfg_.edition);
    argv.emplace_back("-o");
    argv.push_back(output_binary.string());
    argv.insert(argv.end(), cfg_.extra_flags.begin(), cfg_.extra_flags.end());
    return argv;
}

ExecutionResult RustcToolchain::compile(const fs::path& source_file,
                                        const fs::path& output_binary,
                                        CompileMode mode,
                                        std::chrono::seconds timeout) const {
    ProcessOptions opts;
    opts.working_dir = source_file.parent_path();
    opts.timeout = timeout;

    const std::string what = mode == CompileMode::Tests ? cfg_.rustc + " --test" : cfg_.rustc;
    return to_execution_result(run_process(compile_command(source_file, output_binary, mode), opts),
                               what, timeout);
}

ExecutionResult RustcToolchain::execute(const fs::path& binary,
                                        const std::vector<std::string>& args,
                                        std::chrono::seconds timeout) const {
    std::vector<std::string> argv{fs::absolute(binary).string()};
    argv.insert(argv.end(), args.begin(), args.end());

    ProcessOptions opts;
    opts.working_dir = binary.parent_path();
    opts.timeout = timeout;

    return to_execution_result(run_process(argv, opts), "binary execution", timeout);
}

}  // namespace codeact::rust
