/**
 * @file test_config_loader.cpp
 * @brief key=value environment configuration parsing
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "codeact_rust/config_loader.hpp"
#include "codeact_rust/process.hpp"

#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace codeact::rust;
using Catch::Matchers::ContainsSubstring;

namespace {

EnvironmentConfig parse_text(const std::string& text) {
    std::istringstream input(text);
    return ConfigLoader{}.parse(input, "test.cfg");
}

}  // namespace

TEST_CASE("Empty input keeps the defaults", "[config]") {
    const auto cfg = parse_text("# nothing here\n\n   \n");

    REQUIRE(cfg.rustc == "rustc");
    REQUIRE(cfg.edition == "2021");
    REQUIRE(cfg.compile_timeout == std::chrono::seconds{10});
    REQUIRE(cfg.run_timeout == std::chrono::seconds{10});
    REQUIRE(cfg.test_args == std::vector<std::string>{"--nocapture"});
    REQUIRE(cfg.scratch_root.empty());
    REQUIRE(cfg.artifact_root.empty());
    REQUIRE(cfg.safety_penalty == 3.0);
    REQUIRE(cfg.dangerous_patterns == SafetyTransform::default_patterns());
    REQUIRE(cfg.concise_bonus == 0.5);
    REQUIRE(cfg.test_bonus == 1.0);
    REQUIRE(cfg.max_length == 250);
}

TEST_CASE("All recognised keys are applied", "[config]") {
    const auto cfg = parse_text(
        "rustc = /opt/rust/bin/rustc\n"
        "edition=2018\n"
        "compile_timeout=20\n"
        "run_timeout = 5\n"
        "test_args=--nocapture   --test-threads=1\n"
        "scratch_root=/tmp/codeact\n"
        "artifact_root=build/episodes\n"
        "safety.penalty=4.5\n"
        "quality.concise_bonus=0.25\n"
        "quality.test_bonus=2\n"
        "quality.max_length=120\n");

    REQUIRE(cfg.rustc == "/opt/rust/bin/rustc");
    REQUIRE(cfg.edition == "2018");
    REQUIRE(cfg.compile_timeout == std::chrono::seconds{20});
    REQUIRE(cfg.run_timeout == std::chrono::seconds{5});
    REQUIRE(cfg.test_args == std::vector<std::string>{"--nocapture", "--test-threads=1"});
    REQUIRE(cfg.scratch_root == "/tmp/codeact");
    REQUIRE(cfg.artifact_root == "build/episodes");
    REQUIRE(cfg.safety_penalty == 4.5);
    REQUIRE(cfg.concise_bonus == 0.25);
    REQUIRE(cfg.test_bonus == 2.0);
    REQUIRE(cfg.max_length == 120);
}

TEST_CASE("Safety patterns replace the built-in list in file order", "[config]") {
    const auto cfg = parse_text(
        "safety.pattern=std::process::Command\n"
        "# comment between patterns\n"
        "safety.pattern=unsafe\\s*\\{\n");

    REQUIRE(cfg.dangerous_patterns == std::vector<std::string>{"std::process::Command", "unsafe\\s*\\{"});
}

TEST_CASE("Values may contain '='", "[config]") {
    const auto cfg = parse_text("safety.pattern=a==b\n");
    REQUIRE(cfg.dangerous_patterns == std::vector<std::string>{"a==b"});
}

TEST_CASE("Malformed entries name the offending line", "[config]") {
    SECTION("missing delimiter") {
        REQUIRE_THROWS_WITH(parse_text("edition=2021\nrustc\n"), ContainsSubstring("test.cfg:2"));
    }

    SECTION("unknown key") {
        REQUIRE_THROWS_WITH(parse_text("\n\nlanguage=rust\n"),
                            ContainsSubstring("Unknown config key 'language'") && ContainsSubstring("test.cfg:3"));
    }

    SECTION("empty key") {
        REQUIRE_THROWS_AS(parse_text("=value\n"), std::runtime_error);
    }

    SECTION("non-positive timeout") {
        REQUIRE_THROWS_WITH(parse_text("run_timeout=0\n"), ContainsSubstring("positive integer"));
        REQUIRE_THROWS_AS(parse_text("compile_timeout=-4\n"), std::runtime_error);
        REQUIRE_THROWS_AS(parse_text("compile_timeout=10s\n"), std::runtime_error);
    }

    SECTION("bad number") {
        REQUIRE_THROWS_WITH(parse_text("safety.penalty=lots\n"), ContainsSubstring("Invalid number"));
        REQUIRE_THROWS_AS(parse_text("quality.test_bonus=\n"), std::runtime_error);
    }

    SECTION("invalid regular expression") {
        REQUIRE_THROWS_WITH(parse_text("safety.pattern=unsafe (\n"), ContainsSubstring("Invalid safety pattern"));
    }

    SECTION("empty compiler path") {
        REQUIRE_THROWS_AS(parse_text("rustc=\n"), std::runtime_error);
    }
}

TEST_CASE("Config files are loaded from disk", "[config]") {
    const ScratchDirectory scratch;
    const auto file = scratch.path() / "env.cfg";
    {
        std::ofstream out(file);
        out << "# local toolchain\n"
            << "edition=2021\n"
            << "run_timeout=3\n";
    }

    const auto cfg = ConfigLoader{}.load(file);
    REQUIRE(cfg.run_timeout == std::chrono::seconds{3});

    REQUIRE_THROWS_WITH(ConfigLoader{}.load(scratch.path() / "missing.cfg"), ContainsSubstring("does not exist"));
    REQUIRE_THROWS_WITH(ConfigLoader{}.load(scratch.path()), ContainsSubstring("not a regular file"));
}
