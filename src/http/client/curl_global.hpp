#ifndef FURNILYTICS_CURL_GLOBAL_HPP
#define FURNILYTICS_CURL_GLOBAL_HPP

#include <cstddef>

namespace furnilytics::http::client {

    // Scoped libcurl global state. Instances nest: the first one initializes
    // libcurl, the last one to go away cleans it up. Keep one alive for as
    // long as any CurlEasy exists, and create the first one before other
    // threads start.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;

        [[nodiscard]] static size_t active();
    };

}  // namespace furnilytics::http::client

#endif
