#include "codeact_rust/test_harness.hpp"
#include "codeact_rust/snippet_wrapper.hpp"
#include "codeact_rust/text.hpp"

#include <sstream>
#include <string>
#include <string_view>

namespace codeact::rust {

std::string prepare_core_program(std::string_view core_code) {
    std::string program{kAllowUnusedAttribute};
    program += wrap_snippet(core_code);
    return program;
}

std::string build_test_source(std::string_view core_code, std::string_view test_code) {
    const auto core = text::rtrim_copy(core_code);
    const auto tests = text::trim_copy(test_code);

    std::ostringstream oss;
    oss << kAllowUnusedAttribute << core;
    if (tests.empty()) {
        oss << "\n";
        return oss.str();
    }

    oss << "\n#[cfg(test)]\n"
        << "mod " << kTestModuleName << " {\n"
        << "    use super::*;\n"
        << text::indent_lines(tests, "    ") << "\n"
        << "}\n";
    return oss.str();
}

}  // namespace codeact::rust
