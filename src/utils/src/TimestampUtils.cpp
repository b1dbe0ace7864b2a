#include "TimestampUtils.hpp"
#include <chrono>
#include <ctime>
#include <regex>
#include <string>
#include <fmt/format.h>


std::string TimestampUtils::to_iso8601(std::chrono::system_clock::time_point tp) {
    auto ms_since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    auto millis = ms_since_epoch % 1000;
    auto seconds = ms_since_epoch / 1000;
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }

    std::time_t tt = static_cast<std::time_t>(seconds);
    std::tm utc{};
    gmtime_r(&tt, &utc);

    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                       utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                       utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(millis));
}

std::string TimestampUtils::now_iso8601() {
    return to_iso8601(std::chrono::system_clock::now());
}

bool TimestampUtils::is_iso8601(const std::string& value) {
    static const std::regex pattern(
        R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}(\.\d+)?(Z|[+-]\d{2}:\d{2})$)");
    return std::regex_match(value, pattern);
}
