#include "curl_global.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <mutex>
#include <stdexcept>
#include <string>

namespace furnilytics::http::client {
    namespace {
        std::mutex global_mutex;
        size_t global_users = 0;
    }  // namespace

    CurlGlobal::CurlGlobal() {
        std::lock_guard<std::mutex> lock(global_mutex);
        if (global_users == 0) {
            const auto rc = curl_global_init(CURL_GLOBAL_ALL);
            if (rc != CURLE_OK) {
                throw std::runtime_error(std::string("Failed to initialize libcurl: ") + curl_easy_strerror(rc));
            }
            const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
            spdlog::debug("libcurl {} initialized ({})", info->version, info->ssl_version != nullptr ? info->ssl_version : "no TLS");
        }
        ++global_users;
    }

    CurlGlobal::~CurlGlobal() {
        std::lock_guard<std::mutex> lock(global_mutex);
        if (--global_users == 0) {
            curl_global_cleanup();
        }
    }

    size_t CurlGlobal::active() {
        std::lock_guard<std::mutex> lock(global_mutex);
        return global_users;
    }

}  // namespace furnilytics::http::client
