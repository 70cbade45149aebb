/**
 * @file test_test_harness.cpp
 * @brief Core-program preparation and synthesised test module layout
 */

#include <catch2/catch_test_macros.hpp>

#include "codeact_rust/test_harness.hpp"

#include <string>

using codeact::rust::build_test_source;
using codeact::rust::prepare_core_program;

TEST_CASE("Core program carries the unused-code attribute", "[harness]") {
    SECTION("bare statements are wrapped in main") {
        REQUIRE(prepare_core_program("println!(\"hi\");") ==
                "#![allow(unused)]\nfn main() {\n    println!(\"hi\");\n}\n");
    }

    SECTION("existing main is kept") {
        REQUIRE(prepare_core_program("fn main() {}\n\n") == "#![allow(unused)]\nfn main() {}\n");
    }
}

TEST_CASE("Blank test code returns the prefixed core only", "[harness]") {
    const std::string core = "fn add(a: i32, b: i32) -> i32 { a + b }\n\n";
    REQUIRE(build_test_source(core, "") == "#![allow(unused)]\nfn add(a: i32, b: i32) -> i32 { a + b }\n");
    REQUIRE(build_test_source(core, "  \n\t") == build_test_source(core, ""));
}

TEST_CASE("Test code is placed in a cfg(test) module that sees the core", "[harness]") {
    const std::string core = "fn add(a: i32, b: i32) -> i32 { a + b }";
    const std::string tests =
        "#[test]\n"
        "fn adds() {\n"
        "    assert_eq!(add(1, 2), 3);\n"
        "}";

    const auto source = build_test_source(core, tests);

    REQUIRE(source ==
            "#![allow(unused)]\n"
            "fn add(a: i32, b: i32) -> i32 { a + b }\n"
            "#[cfg(test)]\n"
            "mod codeact_tests {\n"
            "    use super::*;\n"
            "    #[test]\n"
            "    fn adds() {\n"
            "        assert_eq!(add(1, 2), 3);\n"
            "    }\n"
            "}\n");

    SECTION("the attribute comes first and the module last") {
        REQUIRE(source.rfind("#![allow(unused)]", 0) == 0);
        REQUIRE(source.find("#[cfg(test)]") > source.find("fn add"));
        REQUIRE(source.find("use super::*;") != std::string::npos);
    }
}
