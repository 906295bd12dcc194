#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>
#include <vector>

#include "constants.hpp"

namespace furnilytics::string_utils {
    bool ieq_prefix(const char *buf, size_t n, const char *key) {
        for (size_t i = 0; key[i] != '\0' && i < n; ++i) {
            if (std::tolower(static_cast<unsigned char>(buf[i])) != std::tolower(static_cast<unsigned char>(key[i]))) {
                return false;
            }
            if (key[i + 1] == '\0') {
                return true;
            }
        }
        return false;
    }

    bool iequals(std::string_view a, std::string_view b) {
        return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); });
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::string strip(std::string_view sv, char c) {
        const auto first = sv.find_first_not_of(c);
        if (first == std::string_view::npos) {
            return {};
        }
        const auto last = sv.find_last_not_of(c);
        return std::string(sv.substr(first, last - first + 1));
    }

    std::vector<std::string> split(std::string_view sv, char delimiter) {
        std::vector<std::string> out;
        size_t start = 0;
        for (;;) {
            size_t pos = sv.find(delimiter, start);
            size_t end = (pos == std::string_view::npos) ? sv.size() : pos;

            out.emplace_back(sv.substr(start, end - start));

            if (pos == std::string_view::npos) {
                break;
            }

            start = pos + 1;
        }
        return out;
    }

    std::string join(const std::vector<std::string> &parts, char delimiter) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) {
                out.push_back(delimiter);
            }
            out += parts[i];
        }
        return out;
    }

    std::optional<long> parse_long(const std::string &s) {
        const std::string trimmed = trim(s);
        if (trimmed.empty()) {
            return std::nullopt;
        }
        char *end = nullptr;
        errno = 0;
        const long value = std::strtol(trimmed.c_str(), &end, constants::BASE_10);
        if (end == trimmed.c_str() || *end != '\0' || errno == ERANGE) {
            return std::nullopt;
        }
        return value;
    }
}  // namespace furnilytics::string_utils
