#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "codeact_rust/config_loader.hpp"
#include "codeact_rust/environment.hpp"
#include "codeact_rust/report_writer.hpp"
#include "codeact_rust/serialization.hpp"

using codeact::rust::ConfigLoader;
using codeact::rust::EnvironmentConfig;
using codeact::rust::EpisodeReportWriter;
using codeact::rust::RustAction;
using codeact::rust::RustCodingEnv;
using codeact::rust::StepRecord;

namespace {

struct Args {
    std::filesystem::path actions_path{};
    std::filesystem::path core_path{};
    std::filesystem::path tests_path{};
    std::filesystem::path config_path{};
    std::filesystem::path artifact_root{"build/episodes"};
    std::filesystem::path summary_path{};
    std::filesystem::path html_path{};
    bool persist_steps{false};
    bool emit_html{true};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "Rust CodeAct episode runner\n"
        << "Usage:\n"
        << "  " << argv0 << " --actions <file.json> [options]\n"
        << "  " << argv0 << " --core <file.rs> [--tests <file.rs>] [options]\n"
        << "\n"
        << "Options:\n"
        << "  --actions      JSON array of {\"core_code\", \"test_code\"} actions, one step each.\n"
        << "  --core         Rust source used as core_code for a single step.\n"
        << "  --tests        Rust test statements used as test_code for the --core step.\n"
        << "  --config       Environment config file (key=value lines).\n"
        << "  --artifact-dir Root directory for outputs (default: build/episodes).\n"
        << "  --keep-steps   Persist per-step sources and outputs under the artifact dir.\n"
        << "  --summary      Write JSON summary to this path (default: <artifact-dir>/summary.json).\n"
        << "  --html         Write HTML report to this path (default: <artifact-dir>/report.html).\n"
        << "  --ci           CI mode: suppress HTML generation (JSON only).\n"
        << "  -h, --help     Show this help message.\n"
        << std::endl;
}

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

std::filesystem::path take_value(int argc, char** argv, int& i, std::string_view flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error(std::string(flag) + " expects a value");
    }
    return std::filesystem::path(argv[++i]);
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            break;
        } else if (arg_eq(tok, "--actions")) {
            args.actions_path = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--core")) {
            args.core_path = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--tests")) {
            args.tests_path = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--config")) {
            args.config_path = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--artifact-dir")) {
            args.artifact_root = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--keep-steps")) {
            args.persist_steps = true;
        } else if (arg_eq(tok, "--summary")) {
            args.summary_path = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--html")) {
            args.html_path = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--ci")) {
            args.emit_html = false;
        } else {
            throw std::runtime_error("Unknown argument: " + std::string(tok));
        }
    }
    if (args.help) {
        return args;
    }

    if (args.actions_path.empty() == args.core_path.empty()) {
        throw std::runtime_error("Exactly one of --actions or --core is required");
    }
    if (!args.tests_path.empty() && args.core_path.empty()) {
        throw std::runtime_error("--tests is only valid together with --core");
    }
    if (args.summary_path.empty()) {
        args.summary_path = args.artifact_root / "summary.json";
    }
    if (args.html_path.empty()) {
        args.html_path = args.artifact_root / "report.html";
    }
    return args;
}

std::string read_source(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw std::runtime_error("Unable to read source file: " + path.string());
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

std::vector<RustAction> collect_actions(const Args& args) {
    if (!args.actions_path.empty()) {
        return codeact::rust::load_actions(args.actions_path);
    }
    std::vector<RustAction> actions;
    actions.emplace_back(read_source(args.core_path),
                         args.tests_path.empty() ? std::string{} : read_source(args.tests_path));
    return actions;
}

int aggregate_exit_code(const std::vector<StepRecord>& steps) {
    for (const auto& s : steps) {
        if (!s.observation.code_compiles || s.observation.tests_failed > 0) {
            return 1;
        }
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        EnvironmentConfig config;
        if (!args.config_path.empty()) {
            config = ConfigLoader{}.load(args.config_path);
        }
        if (args.persist_steps && config.artifact_root.empty()) {
            config.artifact_root = args.artifact_root;
        }

        const auto actions = collect_actions(args);
        std::filesystem::create_directories(args.artifact_root);

        RustCodingEnv env(config);
        (void)env.reset();

        std::vector<StepRecord> steps;
        steps.reserve(actions.size());
        for (const auto& action : actions) {
            auto observation = env.step(action);
            std::cout << "step " << env.state().step_count
                      << ": compiles=" << (observation.code_compiles ? "yes" : "no")
                      << " passed=" << observation.tests_passed
                      << " failed=" << observation.tests_failed
                      << " reward=" << observation.reward << "\n";
            if (!env.diagnostics().empty()) {
                std::cerr << env.diagnostics();
            }
            steps.push_back(StepRecord{action, std::move(observation)});
        }

        EpisodeReportWriter writer;
        writer.write_summary(args.summary_path, env.state(), steps);
        if (args.emit_html) {
            writer.write_detailed(args.html_path, env.state(), steps);
        }

        double total_reward = 0.0;
        for (const auto& s : steps) {
            total_reward += s.observation.reward;
        }

        std::cout << "Rust CodeAct episode " << env.state().episode_id << "\n"
                  << "  Steps: " << steps.size() << "  Total reward: " << total_reward << "\n"
                  << "Artifacts:\n"
                  << "  JSON: " << args.summary_path << "\n";
        if (args.emit_html) {
            std::cout << "  HTML: " << args.html_path << "\n";
        }

        return aggregate_exit_code(steps);
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 2; // configuration/usage issue
    } catch (...) {
        std::cerr << "ERROR: Unknown exception\n";
        return 3; // internal error
    }
}
