#pragma once

#include <string>
#include <string_view>

namespace codeact::rust {

/// Crate-level attribute prepended to every generated compilation unit.
inline constexpr std::string_view kAllowUnusedAttribute = "#![allow(unused)]\n";

/**
 * \brief Returns true when \a code already declares a program entry point
 *        (`fn main(`, allowing whitespace between the tokens).
 */
[[nodiscard]] bool has_entry_point(std::string_view code);

/**
 * \brief Turns a bare statement body into a runnable program.
 *
 * Code that already declares `fn main` is returned trimmed and newline
 * terminated. Anything else is trimmed, indented by four spaces and placed
 * inside a synthesised `fn main() { ... }`. Empty input yields an empty
 * entry point.
 */
[[nodiscard]] std::string wrap_snippet(std::string_view code);

}  // namespace codeact::rust
