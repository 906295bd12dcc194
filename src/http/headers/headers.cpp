#include "headers.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <ctime>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../model/model.hpp"

namespace furnilytics::http::headers {
    namespace {
        bool value_span(const char *buffer, size_t bytes, const char *key, const char *&start, const char *&end) {
            size_t key_len = std::char_traits<char>::length(key);
            if (bytes < key_len) {
                return false;
            }
            for (size_t i = 0; i < key_len; ++i) {
                const char a = buffer[i];
                const char b = key[i];
                if ((a | constants::ASCII_LOWERCASE_BIT) != (b | constants::ASCII_LOWERCASE_BIT)) {
                    return false;
                }  // ASCII-only fold
            }
            start = buffer + key_len;
            end = buffer + bytes;
            while (start < end && (*start == ' ' || *start == '\t')) {
                ++start;
            }
            while (end > start && (end[-1] == '\r' || end[-1] == '\n' || end[-1] == ' ' || end[-1] == '\t')) {
                --end;
            }
            return true;
        }
    }  // namespace

    bool extract_header_value(const char *buffer, size_t bytes, const char *key, std::optional<std::string> &out_property) {
        const char *start = nullptr;
        const char *end = nullptr;
        if (!value_span(buffer, bytes, key, start, end)) {
            return false;
        }
        out_property.emplace(start, end);
        return true;
    }

    bool extract_header_value(const char *buffer, size_t bytes, const char *key, std::optional<long> &out_property) {
        const char *start = nullptr;
        const char *end = nullptr;
        if (!value_span(buffer, bytes, key, start, end)) {
            return false;
        }
        const auto value = string_utils::parse_long(std::string(start, end));
        if (!value) {
            return false;
        }
        out_property = value;
        return true;
    }

    bool is_status_line(const char *buffer, size_t bytes) { return string_utils::ieq_prefix(buffer, bytes, "HTTP/"); }

    void apply_header_line(const char *buffer, size_t bytes, model::Response &resp) {
        if (is_status_line(buffer, bytes)) {
            resp.etag_.reset();
            resp.cache_control_.reset();
            resp.retry_after_.reset();
            resp.content_type_.reset();
            resp.rate_limit_remaining_.reset();
            resp.rate_limit_reset_.reset();
            return;
        }

        if (extract_header_value(buffer, bytes, HeaderKeys::CONTENT_TYPE, resp.content_type_)) {
            return;
        }
        if (extract_header_value(buffer, bytes, HeaderKeys::ETAG, resp.etag_)) {
            return;
        }
        if (extract_header_value(buffer, bytes, HeaderKeys::RETRY_AFTER, resp.retry_after_)) {
            return;
        }
        if (extract_header_value(buffer, bytes, HeaderKeys::X_RATELIMIT_REMAINING, resp.rate_limit_remaining_)) {
            return;
        }
        if (extract_header_value(buffer, bytes, HeaderKeys::X_RATELIMIT_RESET, resp.rate_limit_reset_)) {
            return;
        }
        extract_header_value(buffer, bytes, HeaderKeys::CACHE_CONTROL, resp.cache_control_);
    }

    std::optional<std::chrono::seconds> retry_after_seconds(const model::Response &resp) {
        if (!resp.retry_after_) {
            return std::nullopt;
        }
        if (const auto value = string_utils::parse_long(*resp.retry_after_)) {
            if (*value < 0) {
                return std::nullopt;
            }
            return std::chrono::seconds{*value};
        }

        // HTTP-date form; a date already past means "retry now".
        const time_t at = curl_getdate(resp.retry_after_->c_str(), nullptr);
        if (at == -1) {
            return std::nullopt;
        }
        return std::chrono::seconds{std::max<long long>(0, static_cast<long long>(at) - static_cast<long long>(std::time(nullptr)))};
    }
}  // namespace furnilytics::http::headers
