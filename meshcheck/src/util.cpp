#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <ctime>

namespace util {

std::string format_rfc3339(std::chrono::system_clock::time_point tp) {
    auto itt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc{};
    gmtime_r(&itt, &tm_utc);
    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%FT%TZ");
    return ss.str();
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        // Trim whitespace
        token.erase(0, token.find_first_not_of(" \t\n\r"));
        token.erase(token.find_last_not_of(" \t\n\r") + 1);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::vector<std::string> sorted(std::vector<std::string> items) {
    std::sort(items.begin(), items.end());
    return items;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.compare(0, prefix.size(), prefix) == 0;
}

std::string indent_lines(const std::vector<std::string>& lines, int depth) {
    std::string pad(static_cast<size_t>(depth) * 4, ' ');
    std::vector<std::string> out;
    out.reserve(lines.size());
    for (const auto& line : lines) {
        out.push_back(pad + line);
    }
    return join(out, "\n");
}

long bounded_timeout_ms(std::chrono::milliseconds configured,
                        std::optional<std::chrono::steady_clock::time_point> deadline,
                        std::chrono::steady_clock::time_point now) {
    long timeout = static_cast<long>(configured.count());
    if (!deadline) {
        return timeout;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now);
    return std::min(timeout, static_cast<long>(left.count()));
}

} // namespace util
