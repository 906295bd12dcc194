#ifndef FURNILYTICS_MODEL_HPP
#define FURNILYTICS_MODEL_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace furnilytics::http::model {
    struct Request {
        std::string url_;
        std::string method_ = "GET";

        std::vector<std::string> headers_;
        // Transfer budget for this attempt; the transport's own timeout
        // still applies when it is shorter.
        std::optional<std::chrono::milliseconds> timeout_;
    };

    struct Response {
        long status_ = 0;

        std::string body_;
        std::string effective_url_;

        std::optional<std::string> etag_;
        std::optional<std::string> cache_control_;
        std::optional<std::string> retry_after_;
        std::optional<std::string> content_type_;
        std::optional<long> rate_limit_remaining_;
        std::optional<long> rate_limit_reset_;
    };
}  // namespace furnilytics::http::model

#endif
