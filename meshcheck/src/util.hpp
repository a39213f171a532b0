#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace util {
    std::string format_rfc3339(std::chrono::system_clock::time_point tp);

    std::vector<std::string> split(const std::string& str, char delim);
    std::string join(const std::vector<std::string>& parts, const std::string& sep);
    std::vector<std::string> sorted(std::vector<std::string> items);
    bool starts_with(const std::string& str, const std::string& prefix);

    // The configured request timeout, cut down to what is left before the
    // deadline. Zero or less once the deadline has passed.
    long bounded_timeout_ms(std::chrono::milliseconds configured,
                            std::optional<std::chrono::steady_clock::time_point> deadline,
                            std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    // Prefixes every line with depth * 4 spaces
    std::string indent_lines(const std::vector<std::string>& lines, int depth);
}
