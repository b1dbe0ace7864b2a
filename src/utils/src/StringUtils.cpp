#include "StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <string>

std::string StringUtils::to_lower(const std::string& str) {
    std::string lower_str = str;
    std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower_str;
}

void StringUtils::trim(std::string& str) {
    str.erase(str.begin(), std::find_if(str.begin(), str.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    }));

    str.erase(std::find_if(str.rbegin(), str.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    }).base(), str.end());
}

size_t StringUtils::utf8_length(const std::string& str) {
    // Continuation bytes are 10xxxxxx; every other byte starts a code point
    return static_cast<size_t>(std::count_if(str.begin(), str.end(), [](unsigned char ch) {
        return (ch & 0xC0) != 0x80;
    }));
}
