#ifndef FURNILYTICS_ERRORS_HPP
#define FURNILYTICS_ERRORS_HPP

#include <optional>
#include <stdexcept>
#include <string>

namespace furnilytics::http::error {
    enum class ErrorKind {
        CONFIG,
        NETWORK,
        AUTH,
        NOT_FOUND,
        RATE_LIMIT,
        CLIENT,
    };

    const char *to_string(ErrorKind kind);

    struct Error : public std::runtime_error {
        ErrorKind kind_;
        explicit Error(ErrorKind kind, const std::string &msg);
    };

    // Construction-time only: the client never starts with a bad config.
    struct ConfigError : public Error {
        explicit ConfigError(const std::string &msg);
    };

    // The request never produced an HTTP response (DNS, connect, TLS, timeout).
    struct NetworkError : public Error {
        std::string url_;
        long curl_code_;
        bool timed_out_;
        explicit NetworkError(std::string u, long curl_code, bool timed_out, const std::string &msg);
    };

    struct ApiError : public Error {
        long status_;
        std::string url_;
        std::optional<std::string> raw_;
        explicit ApiError(ErrorKind kind, long s, std::string u, std::optional<std::string> raw, const std::string &msg);
    };

    struct AuthError : public ApiError {
        explicit AuthError(long s, std::string u, std::optional<std::string> raw, const std::string &msg);
    };

    struct NotFoundError : public ApiError {
        explicit NotFoundError(long s, std::string u, std::optional<std::string> raw, const std::string &msg);
    };

    struct RateLimitError : public ApiError {
        // X-RateLimit-Reset when sent, otherwise Retry-After.
        std::optional<long> reset_at_;
        explicit RateLimitError(long s, std::string u, std::optional<std::string> raw, std::optional<long> reset_at, const std::string &msg);
    };

    struct ClientError : public ApiError {
        explicit ClientError(long s, std::string u, std::optional<std::string> raw, const std::string &msg);
    };
}  // namespace furnilytics::http::error

#endif
