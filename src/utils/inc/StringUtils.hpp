#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <cstddef>


class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static void trim(std::string& str);

    // Number of Unicode code points in a UTF-8 string
    static size_t utf8_length(const std::string& str);
};
