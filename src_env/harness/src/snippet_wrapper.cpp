#include "codeact_rust/snippet_wrapper.hpp"
#include "codeact_rust/text.hpp"

#include <regex>
#include <string>
#include <string_view>

namespace codeact::rust {

namespace {

constexpr std::string_view kBodyIndent = "    ";

// `fn main(` as a whole word; `fn main_loop()` is not an entry point.
const std::regex& entry_point_pattern() {
    static const std::regex pattern{R"(\bfn\s+main\s*\()"};
    return pattern;
}

}  // namespace

bool has_entry_point(std::string_view code) {
    return std::regex_search(code.begin(), code.end(), entry_point_pattern());
}

std::string wrap_snippet(std::string_view code) {
    const auto stripped = text::trim_copy(code);
    if (has_entry_point(stripped)) {
        return stripped + "\n";
    }

    std::string program = "fn main() {\n";
    if (!stripped.empty()) {
        program += text::indent_lines(stripped, kBodyIndent);
        program += "\n";
    }
    program += "}\n";
    return program;
}

}  // namespace codeact::rust
