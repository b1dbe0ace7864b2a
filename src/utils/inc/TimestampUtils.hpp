#pragma once

#include <chrono>
#include <string>


class TimestampUtils {
public:
    // ISO-8601 UTC with millisecond precision, e.g. 2026-01-01T08:30:00.125Z
    static std::string to_iso8601(std::chrono::system_clock::time_point tp);
    static std::string now_iso8601();

    static bool is_iso8601(const std::string& value);
};
