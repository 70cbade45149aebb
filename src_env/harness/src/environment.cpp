#include "codeact_rust/environment.hpp"
#include "codeact_rust/rustc_toolchain.hpp"
#include "codeact_rust/serialization.hpp"
#include "codeact_rust/test_harness.hpp"
#include "codeact_rust/text.hpp"
#include "codeact_rust/verdict.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <typeinfo>
#include <utility>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace {

// Random (version 4) UUID in canonical 8-4-4-4-12 form.
std::string make_episode_id() {
    std::random_device rd;
    std::mt19937_64 gen{(static_cast<std::uint64_t>(rd()) << 32) ^ rd()};
    std::uniform_int_distribution<unsigned> byte(0, 255);

    std::array<unsigned, 16> bytes{};
    for (auto& b : bytes) {
        b = byte(gen);
    }
    bytes[6] = (bytes[6] & 0x0Fu) | 0x40u;
    bytes[8] = (bytes[8] & 0x3Fu) | 0x80u;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << bytes[i];
    }
    return oss.str();
}

bool write_text(const fs::path& path, const std::string& text, std::string& diag) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) { diag += "open failed: " + path.string() + "\n"; return false; }
    ofs << text;
    if (!ofs) { diag += "write failed: " + path.string() + "\n"; return false; }
    return true;
}

}  // namespace

namespace codeact::rust {

ScoringPipeline make_default_pipeline(const EnvironmentConfig& config) {
    ScoringPipeline pipeline;
    pipeline.add(SafetyTransform{config.safety_penalty, config.dangerous_patterns});
    pipeline.add(QualityTransform{config.concise_bonus, config.test_bonus, config.max_length});
    return pipeline;
}

std::shared_ptr<const Toolchain> make_rustc_toolchain(const EnvironmentConfig& config) {
    RustcToolchain::Config cfg;
    cfg.rustc = config.rustc;
    cfg.edition = config.edition;
    return std::make_shared<RustcToolchain>(std::move(cfg));
}

RustCodingEnv::RustCodingEnv(EnvironmentConfig config)
    : RustCodingEnv(config, make_rustc_toolchain(config)) {}

RustCodingEnv::RustCodingEnv(EnvironmentConfig config, std::shared_ptr<const Toolchain> toolchain)
    : config_{std::move(config)}, toolchain_{std::move(toolchain)} {
    if (!toolchain_) {
        throw std::invalid_argument("RustCodingEnv requires a toolchain");
    }
}

RustObservation RustCodingEnv::reset() {
    runner_.emplace(toolchain_, CompileRunner::Config{
                                    .compile_timeout = config_.compile_timeout,
                                    .run_timeout = config_.run_timeout,
                                    .test_args = config_.test_args,
                                    .scratch_root = config_.scratch_root,
                                });
    pipeline_ = make_default_pipeline(config_);
    state_ = EpisodeState{};
    state_.episode_id = make_episode_id();
    diag_.clear();

    RustObservation observation;
    observation.code_compiles = true;
    observation.metadata = {
        {kCoreCodeKey, ""},
        {kTestCodeKey, ""},
        {kLastCodeKey, ""},
    };
    pipeline_.apply(observation);
    return observation;
}

RustObservation RustCodingEnv::step(const Action& action) {
    const auto* rust_action = dynamic_cast<const RustAction*>(&action);
    if (rust_action == nullptr) {
        throw std::invalid_argument(std::string("Expected RustAction, received ") + typeid(action).name());
    }
    if (!runner_) {
        throw std::logic_error("RustCodingEnv::step() called before reset()");
    }
    diag_.clear();

    const auto& core_code = rust_action->core_code;
    const auto& test_code = rust_action->test_code;

    StepSources sources;
    sources.core_program = prepare_core_program(core_code);
    ExecutionResult final_result = runner_->compile_only(sources.core_program);
    const bool code_compiles = final_result.exit_code == 0;

    TestSummary summary{};
    if (code_compiles && !text::trim_copy(test_code).empty()) {
        sources.test_program = build_test_source(core_code, test_code);
        final_result = runner_->run_tests(*sources.test_program);
        summary = apply_exit_status(
            parse_test_summary(final_result.stdout_text, final_result.stderr_text),
            final_result.exit_code);
    }

    RustObservation observation;
    observation.stdout_text = std::move(final_result.stdout_text);
    observation.stderr_text = std::move(final_result.stderr_text);
    observation.exit_code = final_result.exit_code;
    observation.tests_passed = summary.passed;
    observation.tests_failed = summary.failed;
    observation.code_compiles = code_compiles;
    observation.reward = calculate_reward(code_compiles, summary.passed, summary.failed);
    observation.metadata = {
        {kCoreCodeKey, core_code},
        {kTestCodeKey, test_code},
        {kLastCodeKey, text::trim_copy(core_code + "\n\n" + test_code)},
    };

    pipeline_.apply(observation);

    // Totals are overwritten with this step's counts, not accumulated.
    state_.step_count += 1;
    state_.last_exit_code = observation.exit_code;
    state_.last_code_compiles = observation.code_compiles;
    state_.total_tests_passed = observation.tests_passed;
    state_.total_tests_failed = observation.tests_failed;

    if (!config_.artifact_root.empty()) {
        persist_step(sources, observation);
    }
    return observation;
}

void RustCodingEnv::persist_step(const StepSources& sources, const RustObservation& observation) {
    const fs::path dir =
        config_.artifact_root / state_.episode_id / ("step_" + std::to_string(state_.step_count));

    (void)write_text(dir / "core.rs", sources.core_program, diag_);
    if (sources.test_program) {
        (void)write_text(dir / "tests.rs", *sources.test_program, diag_);
    }
    (void)write_text(dir / "stdout.txt", observation.stdout_text, diag_);
    (void)write_text(dir / "stderr.txt", observation.stderr_text, diag_);

    nlohmann::json record = {
        {"state", state_},
        {"observation", observation},
    };
    (void)write_text(dir / "observation.json", record.dump(2) + "\n", diag_);
}

}  // namespace codeact::rust
