#include "utils/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <stdexcept>
#include <cctype>

namespace crossarb {
namespace time_utils {

std::string to_iso8601(WallClock t) {
    auto time_t = std::chrono::system_clock::to_time_t(t);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';

    return ss.str();
}

WallClock from_iso8601(const std::string& s) {
    std::tm tm = {};
    std::istringstream ss(s);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("Not an ISO 8601 timestamp: " + s);
    }

    auto time_t = timegm(&tm);
    auto tp = std::chrono::system_clock::from_time_t(time_t);

    // Parse milliseconds if present
    size_t dot_pos = s.find('.');
    if (dot_pos != std::string::npos && dot_pos + 1 < s.length()) {
        int ms = 0;
        size_t digits = 0;
        for (size_t i = dot_pos + 1; i < s.length() && digits < 3 && std::isdigit(static_cast<unsigned char>(s[i])); ++i) {
            ms = ms * 10 + (s[i] - '0');
            ++digits;
        }
        for (; digits > 0 && digits < 3; ++digits) {
            ms *= 10;
        }
        tp += std::chrono::milliseconds(ms);
    }

    return tp;
}

std::string utc_date(WallClock t) {
    auto time_t = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d");
    return ss.str();
}

double hours_between(WallClock since, WallClock until) {
    return std::chrono::duration<double, std::ratio<3600>>(until - since).count();
}

} // namespace time_utils
} // namespace crossarb
