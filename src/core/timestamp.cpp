#include <ccpm/core/timestamp.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ccpm {

std::string FormatIso8601(TimePoint tp) {
    const auto time_t_tp = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
    }

    std::tm utc{};
    gmtime_r(&time_t_tp, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

std::string Iso8601Now() {
    return FormatIso8601(std::chrono::system_clock::now());
}

std::optional<TimePoint> ParseIso8601(std::string_view text) {
    // Minimum: YYYY-MM-DDTHH:MM:SS
    if (text.size() < 19) {
        return std::nullopt;
    }

    std::tm tm{};
    std::istringstream iss(std::string(text.substr(0, 19)));
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }

    auto rest = text.substr(19);
    int millis = 0;
    if (!rest.empty() && rest.front() == '.') {
        rest.remove_prefix(1);
        int digits = 0;
        while (!rest.empty() && std::isdigit(static_cast<unsigned char>(rest.front()))) {
            if (digits < 3) {
                millis = millis * 10 + (rest.front() - '0');
            }
            ++digits;
            rest.remove_prefix(1);
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }

    if (rest != "Z" && rest != "+00:00" && !rest.empty()) {
        return std::nullopt;
    }

    const auto seconds = timegm(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds) +
           std::chrono::milliseconds(millis);
}

std::string FileSafeTimestamp(TimePoint tp) {
    auto stamp = FormatIso8601(tp);
    std::replace(stamp.begin(), stamp.end(), ':', '-');
    std::replace(stamp.begin(), stamp.end(), '.', '-');
    return stamp;
}

} // namespace ccpm
