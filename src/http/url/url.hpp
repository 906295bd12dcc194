#ifndef FURNILYTICS_URL_HPP
#define FURNILYTICS_URL_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace furnilytics::http::url {
    // RFC 3986 percent-encoding; unreserved characters pass through.
    std::string encode(std::string_view value);
    std::string decode(std::string_view value);

    // Strips surrounding '/', then encodes each segment on its own so that the
    // '/' separators survive. Throws std::invalid_argument when nothing is left.
    std::string encode_path_segments(std::string_view identifier);

    std::string build_query(const std::vector<std::pair<std::string, std::string>>& params);

    // Absolute http(s) URL with a host, as parsed by libcurl.
    bool is_absolute_http_url(const std::string& candidate);
}  // namespace furnilytics::http::url

#endif
