#ifndef FURNILYTICS_CURL_EASY_HPP
#define FURNILYTICS_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <string>
#include <vector>

#include "../../utils/constants.hpp"
#include "../model/model.hpp"
#include "interface.hpp"

struct curl_slist;

namespace furnilytics::http::client {
    const size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

    struct CurlOptions {
        long timeout_ms_ = constants::DEFAULT_TIMEOUT_S * constants::MS_PER_SECOND;
        long connect_timeout_ms_ = constants::CONNECT_TIMEOUT_MS;
    };

    // libcurl-backed IHttpClient. Owns one easy handle, so connections are
    // reused across calls on the same instance; not safe to share between
    // threads. Request headers are sent as given, User-Agent included.
    class CurlEasy : public IHttpClient {
       public:
        explicit CurlEasy(CurlOptions options = {});

        ~CurlEasy() override;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::Response get(const http::model::Request& req) override;

        void enable_keepalive();
        void enable_compression();

       private:
        // Scratch for one transfer; the callbacks write straight into it.
        struct Exchange {
            http::model::Response response_;
        };

        template <typename T>
        void setopt(CURLoption option, T value);

        void configure_handle();
        void bind_request(const http::model::Request& req, Exchange& exchange);
        [[nodiscard]] long transfer_timeout_ms(const http::model::Request& req) const;
        void replace_header_list(const std::vector<std::string>& hs);
        void perform_or_throw(const std::string& url);
        void collect_info(Exchange& exchange);

        static size_t body_cb(char* ptr, size_t size, size_t n_items, void* userdata);
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);

        CurlOptions options_;

        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
    };
}  // namespace furnilytics::http::client

#endif
