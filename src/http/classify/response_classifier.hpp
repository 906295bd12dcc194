#ifndef FURNILYTICS_RESPONSE_CLASSIFIER_HPP
#define FURNILYTICS_RESPONSE_CLASSIFIER_HPP

#include <optional>
#include <string>
#include <string_view>

#include "../error/errors.hpp"
#include "../model/model.hpp"

namespace furnilytics::http::classify {
    enum class HttpStatusCode : long {
        OK = 200,
        MULTIPLE_CHOICES = 300,
        BAD_REQUEST = 400,
        UNAUTHORIZED = 401,
        FORBIDDEN = 403,
        NOT_FOUND = 404,
        TOO_MANY_REQUESTS = 429,
        INTERNAL_SERVER_ERROR = 500,
        NETWORK_CONNECT_TIMEOUT = 599,
    };

    struct Classification {
        long status_ = 0;
        // Empty on success.
        std::optional<error::ErrorKind> error_;
        std::string message_;
        // Minified JSON body, when the body parsed.
        std::optional<std::string> raw_;

        [[nodiscard]] bool ok() const { return !error_.has_value(); }

        // 429 and 5xx may resolve on their own; everything else is a
        // deterministic outcome of the request.
        [[nodiscard]] bool is_transient() const;
    };

    [[nodiscard]] Classification classify(long status, std::string_view body);
    [[nodiscard]] Classification classify(const http::model::Response& resp);

    // Raises the typed ApiError matching a failed classification.
    [[noreturn]] void throw_error(const Classification& c, const http::model::Response& resp);
}  // namespace furnilytics::http::classify

#endif
