#include <canary/core/utils/relative_time.hpp>
#include <algorithm>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace Canary {

namespace {

constexpr int64_t kMinute = 60;
constexpr int64_t kHour = 60 * kMinute;
constexpr int64_t kDay = 24 * kHour;
constexpr int64_t kWeek = 7 * kDay;
constexpr int64_t kMonth = 30 * kDay;
constexpr int64_t kYear = 365 * kDay;

std::string plural(int64_t count, const char* unit) {
    return std::to_string(count) + " " + unit;
}

// Phrase without tense; empty string means "now"
std::string roughPeriod(int64_t n) {
    if (n > 547 * kDay)               return plural(std::max(n / kYear, int64_t{2}), "years");
    if (n > 345 * kDay)               return "a year";
    if (n > 45 * kDay)                return plural(std::max(n / kMonth, int64_t{2}), "months");
    if (n > 29 * kDay)                return "a month";
    if (n > 10 * kDay + 12 * kHour)   return plural(std::max(n / kWeek, int64_t{2}), "weeks");
    if (n > 6 * kDay + 12 * kHour)    return "a week";
    if (n > 36 * kHour)               return plural(std::max(n / kDay, int64_t{2}), "days");
    if (n > 22 * kHour)               return "a day";
    if (n > 90 * kMinute)             return plural(std::max(n / kHour, int64_t{2}), "hours");
    if (n > 45 * kMinute)             return "an hour";
    if (n > 90)                       return plural(std::max(n / kMinute, int64_t{2}), "minutes");
    if (n > 45)                       return "a minute";
    if (n > 10)                       return "seconds";
    return {};
}

} // anonymous namespace

std::string humanizeSince(std::chrono::system_clock::time_point when,
                          std::chrono::system_clock::time_point reference) {
    const int64_t delta = std::chrono::duration_cast<std::chrono::seconds>(when - reference).count();
    const int64_t magnitude = delta < 0 ? -delta : delta;

    std::string period = roughPeriod(magnitude);
    if (period.empty()) {
        return "now";
    }
    return delta < 0 ? period + " ago" : "in " + period;
}

std::string formatUtcTimestamp(std::chrono::system_clock::time_point when) {
    const auto sinceEpoch = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch());
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch);
    auto millis = sinceEpoch - seconds;
    if (millis.count() < 0) {
        seconds -= std::chrono::seconds(1);
        millis += std::chrono::seconds(1);
    }

    const std::time_t raw = static_cast<std::time_t>(seconds.count());
    std::tm utc{};
    gmtime_r(&raw, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis.count() << 'Z';
    return oss.str();
}

} // namespace Canary
