/**
 * @file types.cpp
 * @brief Time formatting and parsing helpers shared by logs, events and reports.
 * @author Dimitris Kafetzis
 */

#include "core/types.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace agent_orchestrator {

std::string format_timestamp(Timestamp ts) {
    auto time_t_ts = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_ts, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::optional<Timestamp> parse_timestamp(std::string_view text) {
    std::tm utc{};
    std::istringstream iss{std::string{text}};
    iss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) return std::nullopt;

    int millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        std::string digits;
        while (std::isdigit(iss.peek())) digits.push_back(static_cast<char>(iss.get()));
        digits.resize(3, '0');
        millis = std::stoi(digits.substr(0, 3));
    }

    auto seconds = timegm(&utc);
    return std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds{millis};
}

std::string format_elapsed(Millis elapsed) {
    auto total = elapsed.count() / 1000;
    if (total < 0) total = 0;
    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    auto seconds = total % 60;

    std::ostringstream oss;
    oss << std::setfill('0');
    if (hours > 0) {
        oss << std::setw(2) << hours << ':';
    }
    oss << std::setw(2) << minutes << ':' << std::setw(2) << seconds;
    return oss.str();
}

}  // namespace agent_orchestrator
