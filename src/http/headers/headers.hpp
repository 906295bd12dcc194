#ifndef FURNILYTICS_HEADERS_HPP
#define FURNILYTICS_HEADERS_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "../model/model.hpp"

namespace furnilytics::http::headers {
    struct HeaderKeys {
        static constexpr const char* CONTENT_TYPE = "content-type:";
        static constexpr const char* ETAG = "etag:";
        static constexpr const char* RETRY_AFTER = "retry-after:";
        static constexpr const char* X_RATELIMIT_REMAINING = "x-ratelimit-remaining:";
        static constexpr const char* X_RATELIMIT_RESET = "x-ratelimit-reset:";
        static constexpr const char* CACHE_CONTROL = "cache-control:";
    };

    bool extract_header_value(const char* buffer, size_t bytes, const char* key, std::optional<std::string>& out_property);
    bool extract_header_value(const char* buffer, size_t bytes, const char* key, std::optional<long>& out_property);

    // True for "HTTP/1.1 200 OK" style lines that open a new header block.
    bool is_status_line(const char* buffer, size_t bytes);

    // Feeds one raw header line into the recognized fields of resp. A status
    // line clears what an earlier response in a redirect chain left behind.
    void apply_header_line(const char* buffer, size_t bytes, model::Response& resp);

    // Retry-After as a wait from now: delta-seconds, or the time left until
    // an HTTP-date (zero once it has passed). Unparseable values give nullopt.
    std::optional<std::chrono::seconds> retry_after_seconds(const model::Response& resp);
}  // namespace furnilytics::http::headers

#endif
