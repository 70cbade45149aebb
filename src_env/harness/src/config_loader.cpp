#include "codeact_rust/config_loader.hpp"
#include "codeact_rust/text.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <istream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using codeact::rust::text::trim_copy;

std::string where(const std::string& origin, std::size_t line_no) {
    return origin + ":" + std::to_string(line_no);
}

double parse_double(const std::string& raw, const std::string& key,
                    const std::string& origin, std::size_t line_no) {
    std::size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(raw, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (raw.empty() || consumed != raw.size()) {
        throw std::runtime_error("Invalid number '" + raw + "' for '" + key + "' at " +
                                 where(origin, line_no));
    }
    return value;
}

long long parse_positive_integer(const std::string& raw, const std::string& key,
                                 const std::string& origin, std::size_t line_no) {
    std::size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(raw, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (raw.empty() || consumed != raw.size() || value <= 0) {
        throw std::runtime_error("Expected a positive integer for '" + key + "' but got '" + raw +
                                 "' at " + where(origin, line_no));
    }
    return value;
}

std::vector<std::string> split_words(const std::string& raw) {
    std::istringstream iss(raw);
    std::vector<std::string> words;
    std::string word;
    while (iss >> word) {
        words.push_back(std::move(word));
    }
    return words;
}

}  // namespace

namespace codeact::rust {

EnvironmentConfig ConfigLoader::load(const std::filesystem::path& file) const {
    if (!std::filesystem::exists(file)) {
        throw std::runtime_error("Config file does not exist: " + file.string());
    }
    if (!std::filesystem::is_regular_file(file)) {
        throw std::runtime_error("Config path is not a regular file: " + file.string());
    }

    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open config file: " + file.string());
    }
    return parse(input, file.string());
}

EnvironmentConfig ConfigLoader::parse(std::istream& input, const std::string& origin) const {
    EnvironmentConfig cfg;
    bool patterns_overridden = false;

    std::string raw_line;
    std::size_t line_no = 0;
    while (std::getline(input, raw_line)) {
        ++line_no;

        const auto trimmed = trim_copy(raw_line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }

        const auto delimiter = trimmed.find('=');
        if (delimiter == std::string::npos) {
            throw std::runtime_error("Expected 'key=value' entry at " + where(origin, line_no));
        }

        const auto key = trim_copy(std::string_view{trimmed}.substr(0, delimiter));
        auto value = trim_copy(std::string_view{trimmed}.substr(delimiter + 1));
        if (key.empty()) {
            throw std::runtime_error("Empty key at " + where(origin, line_no));
        }

        if (key == "rustc") {
            if (value.empty()) {
                throw std::runtime_error("Empty compiler path at " + where(origin, line_no));
            }
            cfg.rustc = std::move(value);
        } else if (key == "edition") {
            cfg.edition = std::move(value);
        } else if (key == "compile_timeout") {
            cfg.compile_timeout = std::chrono::seconds(parse_positive_integer(value, key, origin, line_no));
        } else if (key == "run_timeout") {
            cfg.run_timeout = std::chrono::seconds(parse_positive_integer(value, key, origin, line_no));
        } else if (key == "test_args") {
            cfg.test_args = split_words(value);
        } else if (key == "scratch_root") {
            cfg.scratch_root = std::filesystem::path(value);
        } else if (key == "artifact_root") {
            cfg.artifact_root = std::filesystem::path(value);
        } else if (key == "safety.penalty") {
            cfg.safety_penalty = parse_double(value, key, origin, line_no);
        } else if (key == "safety.pattern") {
            if (value.empty()) {
                throw std::runtime_error("Empty safety pattern at " + where(origin, line_no));
            }
            try {
                (void)std::regex{value};
            } catch (const std::regex_error& ex) {
                throw std::runtime_error("Invalid safety pattern '" + value + "' at " +
                                         where(origin, line_no) + ": " + ex.what());
            }
            if (!patterns_overridden) {
                cfg.dangerous_patterns.clear();
                patterns_overridden = true;
            }
            cfg.dangerous_patterns.push_back(std::move(value));
        } else if (key == "quality.concise_bonus") {
            cfg.concise_bonus = parse_double(value, key, origin, line_no);
        } else if (key == "quality.test_bonus") {
            cfg.test_bonus = parse_double(value, key, origin, line_no);
        } else if (key == "quality.max_length") {
            cfg.max_length = static_cast<std::size_t>(parse_positive_integer(value, key, origin, line_no));
        } else {
            throw std::runtime_error("Unknown config key '" + key + "' at " + where(origin, line_no));
        }
    }

    return cfg;
}

}  // namespace codeact::rust
