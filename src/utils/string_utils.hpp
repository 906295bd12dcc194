#ifndef FURNILYTICS_STRING_UTILS_HPP
#define FURNILYTICS_STRING_UTILS_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace furnilytics::string_utils {
    bool ieq_prefix(const char* buf, size_t n, const char* key);

    bool iequals(std::string_view a, std::string_view b);

    std::string trim(std::string s);

    std::string strip(std::string_view sv, char c);

    // Splits on every delimiter, keeping empty tokens.
    std::vector<std::string> split(std::string_view sv, char delimiter);

    std::string join(const std::vector<std::string>& parts, char delimiter);

    std::optional<long> parse_long(const std::string& s);
}  // namespace furnilytics::string_utils

#endif
