#pragma once

#include <string>
#include <vector>
#include <algorithm>
#include <cctype>


class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static void trim(std::string& str);

    // Split on a delimiter, trimming each piece and dropping empty ones
    static std::vector<std::string> split_list(const std::string& str, char delimiter = ',');

    static std::string join(const std::vector<std::string>& parts, const std::string& separator);

    // Replace every occurrence of `from` with `to`
    static std::string replace_all(const std::string& str, const std::string& from, const std::string& to);
};
