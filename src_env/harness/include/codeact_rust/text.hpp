#pragma once

#include <string>
#include <string_view>

namespace codeact::rust::text {

inline constexpr std::string_view kWhitespace = " \t\n\r\f\v";

[[nodiscard]] std::string trim_copy(std::string_view input);

[[nodiscard]] std::string rtrim_copy(std::string_view input);

/**
 * \brief Prefixes every non-blank line with \a prefix. Blank lines are kept
 *        as-is so no trailing whitespace is introduced.
 */
[[nodiscard]] std::string indent_lines(std::string_view input, std::string_view prefix);

}  // namespace codeact::rust::text
