#include "curl_easy.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "../error/errors.hpp"
#include "../headers/headers.hpp"
#include "../model/model.hpp"

namespace furnilytics::http::client {
    namespace {
        struct HandleSettings {
            static constexpr long FOLLOW_LOCATION = 1L;
            static constexpr long MAX_REDIRECTS = 5L;
            static constexpr const char* ALLOWED_PROTOCOLS = "http,https";
            static constexpr long NO_PROGRESS = 1L;
            static constexpr long NO_SIGNAL = 1L;
            static constexpr long FAIL_ON_ERROR = 0L;
            static constexpr long TCP_KEEPALIVE = 1L;
            static constexpr long TCP_KEEPIDLE = 120L;
            static constexpr long TCP_KEEPINTVL = 60L;
            static constexpr long HTTP_GET = 1L;
            // Empty string => every encoding libcurl was built with.
            static constexpr const char* ACCEPT_ENCODING = "";
        };
    }  // namespace

    CurlEasy::CurlEasy(CurlOptions options) : options_(std::move(options)), handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        configure_handle();
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlEasy::configure_handle() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, HandleSettings::FOLLOW_LOCATION);
        setopt(CURLOPT_MAXREDIRS, HandleSettings::MAX_REDIRECTS);
        setopt(CURLOPT_PROTOCOLS_STR, HandleSettings::ALLOWED_PROTOCOLS);
        setopt(CURLOPT_REDIR_PROTOCOLS_STR, HandleSettings::ALLOWED_PROTOCOLS);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms_);
        setopt(CURLOPT_NOPROGRESS, HandleSettings::NO_PROGRESS);
        setopt(CURLOPT_NOSIGNAL, HandleSettings::NO_SIGNAL);
        // 4xx/5xx are responses for the classifier, not transport failures.
        setopt(CURLOPT_FAILONERROR, HandleSettings::FAIL_ON_ERROR);
        setopt(CURLOPT_HTTPGET, HandleSettings::HTTP_GET);
        setopt(CURLOPT_WRITEFUNCTION, &CurlEasy::body_cb);
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
    }

    void CurlEasy::enable_keepalive() {
        setopt(CURLOPT_TCP_KEEPALIVE, HandleSettings::TCP_KEEPALIVE);
        setopt(CURLOPT_TCP_KEEPIDLE, HandleSettings::TCP_KEEPIDLE);
        setopt(CURLOPT_TCP_KEEPINTVL, HandleSettings::TCP_KEEPINTVL);
    }

    void CurlEasy::enable_compression() { setopt(CURLOPT_ACCEPT_ENCODING, HandleSettings::ACCEPT_ENCODING); }

    void CurlEasy::replace_header_list(const std::vector<std::string>& hs) {
        curl_slist* fresh = nullptr;
        for (const auto& h : hs) {
            curl_slist* appended = curl_slist_append(fresh, h.c_str());
            if (appended == nullptr) {
                curl_slist_free_all(fresh);
                throw std::runtime_error("curl_slist_append failed");
            }
            fresh = appended;
        }

        setopt(CURLOPT_HTTPHEADER, fresh);
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }
        headers_ = fresh;
    }

    void CurlEasy::bind_request(const http::model::Request& req, Exchange& exchange) {
        setopt(CURLOPT_URL, req.url_.c_str());
        setopt(CURLOPT_TIMEOUT_MS, transfer_timeout_ms(req));
        replace_header_list(req.headers_);
        setopt(CURLOPT_WRITEDATA, static_cast<void*>(&exchange));
        setopt(CURLOPT_HEADERDATA, static_cast<void*>(&exchange));
    }

    long CurlEasy::transfer_timeout_ms(const http::model::Request& req) const {
        if (!req.timeout_) {
            return options_.timeout_ms_;
        }
        return static_cast<long>(std::min<long long>(options_.timeout_ms_, req.timeout_->count()));
    }

    size_t CurlEasy::body_cb(char* ptr, size_t size, size_t n_items, void* userdata) {
        auto* exchange = static_cast<Exchange*>(userdata);
        const size_t bytes = size * n_items;
        exchange->response_.body_.append(ptr, bytes);
        return bytes;
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* exchange = static_cast<Exchange*>(userdata);
        const size_t bytes = size * n_items;
        headers::apply_header_line(buffer, bytes, exchange->response_);
        return bytes;
    }

    http::model::Response CurlEasy::get(const http::model::Request& req) {
        if (req.method_ != "GET") {
            throw std::invalid_argument("CurlEasy only issues GET requests, got " + req.method_);
        }

        Exchange exchange;
        bind_request(req, exchange);

        perform_or_throw(req.url_);
        collect_info(exchange);

        return std::move(exchange.response_);
    }

    template <typename T>
    void CurlEasy::setopt(CURLoption option, T value) {
        const auto rc = curl_easy_setopt(handle_, option, value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }

    void CurlEasy::perform_or_throw(const std::string& url) {
        error_buf_[0] = '\0';
        const CURLcode rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        std::string err = "Request to " + url + " failed: ";
        err += error_buf_[0] != '\0' ? error_buf_.data() : curl_easy_strerror(rc);

        throw http::error::NetworkError(url, static_cast<long>(rc), rc == CURLE_OPERATION_TIMEDOUT, err);
    }

    void CurlEasy::collect_info(Exchange& exchange) {
        long code = 0;
        char* eff = nullptr;
        double total_s = 0.0;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff);
        curl_easy_getinfo(handle_, CURLINFO_TOTAL_TIME, &total_s);

        exchange.response_.status_ = code;
        exchange.response_.effective_url_ = eff != nullptr ? eff : std::string{};

        spdlog::debug("GET {} -> {} ({} bytes, {:.3f}s)", exchange.response_.effective_url_, code, exchange.response_.body_.size(), total_s);
    }

}  // namespace furnilytics::http::client
