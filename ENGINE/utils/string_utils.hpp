#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace tumble::strings {

inline std::string to_lower_copy(std::string_view value) {
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

inline std::string trim_copy(std::string_view value) {
    std::size_t start = 0;
    std::size_t end = value.size();

    while (start < end && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }

    return std::string(value.substr(start, end - start));
}

// "Fade In", "fade-in" and "FADE_IN" all become "fade_in".
inline std::string normalize_key(std::string_view value) {
    std::string key = to_lower_copy(trim_copy(value));
    std::replace_if(key.begin(), key.end(), [](char c) { return c == ' ' || c == '-'; }, '_');
    return key;
}

}
