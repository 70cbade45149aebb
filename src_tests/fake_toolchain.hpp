#pragma once

#include "codeact_rust/compile_runner.hpp"

#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace codeact::rust::testing {

/**
 * Toolchain double returning scripted results in call order. Unscripted calls
 * succeed with empty output. Every call is recorded, including the source text
 * read at compile time (the scratch directory is gone once the call returns).
 */
class FakeToolchain final : public Toolchain {
public:
    struct CompileCall {
        std::string source;
        std::filesystem::path source_file;
        std::filesystem::path output_binary;
        CompileMode mode;
        std::chrono::seconds timeout;
    };

    struct ExecuteCall {
        std::filesystem::path binary;
        std::vector<std::string> args;
        std::chrono::seconds timeout;
    };

    FakeToolchain& on_compile(ExecutionResult result) {
        compile_script_.push_back(std::move(result));
        return *this;
    }

    FakeToolchain& on_execute(ExecutionResult result) {
        execute_script_.push_back(std::move(result));
        return *this;
    }

    ExecutionResult compile(const std::filesystem::path& source_file,
                            const std::filesystem::path& output_binary,
                            CompileMode mode,
                            std::chrono::seconds timeout) const override {
        std::ifstream in(source_file, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        compile_calls.push_back(CompileCall{ss.str(), source_file, output_binary, mode, timeout});
        return next(compile_script_);
    }

    ExecutionResult execute(const std::filesystem::path& binary,
                            const std::vector<std::string>& args,
                            std::chrono::seconds timeout) const override {
        execute_calls.push_back(ExecuteCall{binary, args, timeout});
        return next(execute_script_);
    }

    mutable std::vector<CompileCall> compile_calls;
    mutable std::vector<ExecuteCall> execute_calls;

private:
    static ExecutionResult next(std::deque<ExecutionResult>& script) {
        if (script.empty()) {
            return ExecutionResult{};
        }
        auto result = std::move(script.front());
        script.pop_front();
        return result;
    }

    mutable std::deque<ExecutionResult> compile_script_;
    mutable std::deque<ExecutionResult> execute_script_;
};

}  // namespace codeact::rust::testing
