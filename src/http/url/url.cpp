#include "url.hpp"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "../../utils/string_utils.hpp"

namespace furnilytics::http::url {
    namespace {
        using CurlString = std::unique_ptr<char, decltype(&curl_free)>;
        using CurlUrl = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

        std::string get_part(CURLU *handle, CURLUPart part) {
            char *raw = nullptr;
            if (curl_url_get(handle, part, &raw, 0) != CURLUE_OK || raw == nullptr) {
                return {};
            }
            CurlString owned(raw, &curl_free);
            return {owned.get()};
        }
    }  // namespace

    std::string encode(std::string_view value) {
        if (value.empty()) {
            return {};
        }
        CurlString escaped(curl_easy_escape(nullptr, value.data(), static_cast<int>(value.size())), &curl_free);
        if (escaped == nullptr) {
            throw std::runtime_error("curl_easy_escape failed");
        }
        return {escaped.get()};
    }

    std::string decode(std::string_view value) {
        if (value.empty()) {
            return {};
        }
        int out_len = 0;
        CurlString unescaped(curl_easy_unescape(nullptr, value.data(), static_cast<int>(value.size()), &out_len), &curl_free);
        if (unescaped == nullptr) {
            throw std::runtime_error("curl_easy_unescape failed");
        }
        return {unescaped.get(), static_cast<size_t>(out_len)};
    }

    std::string encode_path_segments(std::string_view identifier) {
        const std::string stripped = string_utils::strip(identifier, '/');
        if (stripped.empty()) {
            throw std::invalid_argument("Dataset identifier must not be empty");
        }

        std::vector<std::string> segments = string_utils::split(stripped, '/');
        for (auto &segment : segments) {
            segment = encode(segment);
        }
        return string_utils::join(segments, '/');
    }

    std::string build_query(const std::vector<std::pair<std::string, std::string>> &params) {
        std::string out;
        for (const auto &[key, value] : params) {
            out += out.empty() ? '?' : '&';
            out += encode(key);
            out += '=';
            out += encode(value);
        }
        return out;
    }

    bool is_absolute_http_url(const std::string &candidate) {
        CurlUrl handle(curl_url(), &curl_url_cleanup);
        if (handle == nullptr) {
            throw std::runtime_error("Failed to create CURLU handle");
        }

        if (curl_url_set(handle.get(), CURLUPART_URL, candidate.c_str(), 0) != CURLUE_OK) {
            return false;
        }

        const std::string scheme = get_part(handle.get(), CURLUPART_SCHEME);
        if (!string_utils::iequals(scheme, "http") && !string_utils::iequals(scheme, "https")) {
            return false;
        }

        return !get_part(handle.get(), CURLUPART_HOST).empty();
    }
}  // namespace furnilytics::http::url
