#include <recall/memory/time_utils.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace recall::memory {

namespace {

std::optional<TimePoint> fromUnix(long long value, bool millis) {
    if (value < 0) {
        return std::nullopt;
    }
    if (millis) {
        return TimePoint{} + std::chrono::milliseconds(value);
    }
    return TimePoint{} + std::chrono::seconds(value);
}

std::optional<TimePoint> parseUnixTimestamp(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                         [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        return std::nullopt;
    }
    try {
        long long value = std::stoll(text);
        // 13-digit values are milliseconds, 10-digit values are seconds
        return fromUnix(value, text.length() > 11);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<TimePoint> parseISO8601(const std::string& text) {
    std::tm tm = {};
    std::istringstream ss(text);

    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (!ss.fail()) {
        std::string rest;
        ss >> rest;

        // Drop fractional seconds
        if (!rest.empty() && rest[0] == '.') {
            size_t i = 1;
            while (i < rest.size() && std::isdigit(static_cast<unsigned char>(rest[i]))) {
                ++i;
            }
            rest = rest.substr(i);
        }

        auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
        if (rest.empty() || rest == "Z" || rest == "z") {
            return tp;
        }
        if (rest.size() >= 3 && (rest[0] == '+' || rest[0] == '-')) {
            int sign = (rest[0] == '+') ? 1 : -1;
            int hours = 0;
            int minutes = 0;
            try {
                hours = std::stoi(rest.substr(1, 2));
                if (rest.size() >= 6 && rest[3] == ':') {
                    minutes = std::stoi(rest.substr(4, 2));
                } else if (rest.size() >= 5) {
                    minutes = std::stoi(rest.substr(3, 2));
                }
            } catch (const std::exception&) {
                return std::nullopt;
            }
            auto offset = std::chrono::hours(hours) + std::chrono::minutes(minutes);
            return tp - sign * offset;
        }
        return std::nullopt;
    }

    // Date-only format (YYYY-MM-DD)
    tm = {};
    ss.clear();
    ss.str(text);
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (!ss.fail()) {
        tm.tm_hour = 0;
        tm.tm_min = 0;
        tm.tm_sec = 0;
        return std::chrono::system_clock::from_time_t(timegm(&tm));
    }

    return std::nullopt;
}

} // namespace

std::optional<TimePoint> parseTimestamp(const std::string& text) {
    std::string trimmed = text;
    trimmed.erase(trimmed.begin(),
                  std::find_if(trimmed.begin(), trimmed.end(),
                               [](unsigned char ch) { return !std::isspace(ch); }));
    trimmed.erase(std::find_if(trimmed.rbegin(), trimmed.rend(),
                               [](unsigned char ch) { return !std::isspace(ch); })
                      .base(),
                  trimmed.end());
    if (trimmed.empty()) {
        return std::nullopt;
    }

    if (auto tp = parseUnixTimestamp(trimmed)) {
        return tp;
    }
    return parseISO8601(trimmed);
}

std::optional<TimePoint> parseTimestamp(const nlohmann::json& value) {
    if (value.is_string()) {
        return parseTimestamp(value.get<std::string>());
    }
    if (value.is_number_integer() || value.is_number_unsigned()) {
        auto raw = value.get<long long>();
        return fromUnix(raw, raw > 99'999'999'999LL);
    }
    if (value.is_number_float()) {
        double raw = value.get<double>();
        if (!std::isfinite(raw) || raw < 0.0) {
            return std::nullopt;
        }
        return TimePoint{} + std::chrono::milliseconds(static_cast<long long>(raw * 1000.0));
    }
    return std::nullopt;
}

double ageInDays(const std::optional<TimePoint>& ts, TimePoint now) {
    if (!ts) {
        return 0.0;
    }
    auto elapsed = std::chrono::duration<double>(now - *ts).count();
    return std::max(0.0, elapsed / 86400.0);
}

} // namespace recall::memory
