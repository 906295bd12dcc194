#ifndef FURNILYTICS_CLIENT_INTERFACE_HPP
#define FURNILYTICS_CLIENT_INTERFACE_HPP

#include <functional>
#include <memory>

#include "../model/model.hpp"

namespace furnilytics::http::client {
    // One blocking attempt. Any HTTP status is a returned Response; only a
    // failure to obtain one throws http::error::NetworkError.
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        virtual http::model::Response get(const http::model::Request& req) = 0;
    };

    using HttpClientFactory = std::function<std::unique_ptr<IHttpClient>()>;
}  // namespace furnilytics::http::client

#endif
