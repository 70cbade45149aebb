#include "codeact_rust/text.hpp"

#include <string>
#include <string_view>

namespace codeact::rust::text {

std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

std::string rtrim_copy(std::string_view input) {
    const auto end = input.find_last_not_of(kWhitespace);
    if (end == std::string_view::npos) {
        return {};
    }
    return std::string{input.substr(0, end + 1)};
}

std::string indent_lines(std::string_view input, std::string_view prefix) {
    std::string out;
    out.reserve(input.size() + prefix.size() * 8);

    std::size_t pos = 0;
    while (pos <= input.size()) {
        const auto nl = input.find('\n', pos);
        const auto line = (nl == std::string_view::npos) ? input.substr(pos)
                                                         : input.substr(pos, nl - pos);
        if (line.find_first_not_of(kWhitespace) != std::string_view::npos) {
            out.append(prefix);
        }
        out.append(line);
        if (nl == std::string_view::npos) {
            break;
        }
        out.push_back('\n');
        pos = nl + 1;
    }
    return out;
}

}  // namespace codeact::rust::text
