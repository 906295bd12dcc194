#include "errors.hpp"

#include <stdexcept>
#include <string>

namespace furnilytics::http::error {
    const char *to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::CONFIG:
                return "config";
            case ErrorKind::NETWORK:
                return "network";
            case ErrorKind::AUTH:
                return "auth";
            case ErrorKind::NOT_FOUND:
                return "not_found";
            case ErrorKind::RATE_LIMIT:
                return "rate_limit";
            case ErrorKind::CLIENT:
                return "client";
        }
        return "unknown";
    }

    Error::Error(ErrorKind kind, const std::string &msg) : std::runtime_error(msg), kind_(kind) {}

    ConfigError::ConfigError(const std::string &msg) : Error(ErrorKind::CONFIG, msg) {}

    NetworkError::NetworkError(std::string u, long curl_code, bool timed_out, const std::string &msg)
        : Error(ErrorKind::NETWORK, msg), url_(std::move(u)), curl_code_(curl_code), timed_out_(timed_out) {}

    ApiError::ApiError(ErrorKind kind, long s, std::string u,
                       std::optional<std::string> raw,  // NOLINT(bugprone-easily-swappable-parameters)
                       const std::string &msg)
        : Error(kind, msg), status_(s), url_(std::move(u)), raw_(std::move(raw)) {}

    AuthError::AuthError(long s, std::string u, std::optional<std::string> raw, const std::string &msg)
        : ApiError(ErrorKind::AUTH, s, std::move(u), std::move(raw), msg) {}

    NotFoundError::NotFoundError(long s, std::string u, std::optional<std::string> raw, const std::string &msg)
        : ApiError(ErrorKind::NOT_FOUND, s, std::move(u), std::move(raw), msg) {}

    RateLimitError::RateLimitError(long s, std::string u, std::optional<std::string> raw, std::optional<long> reset_at, const std::string &msg)
        : ApiError(ErrorKind::RATE_LIMIT, s, std::move(u), std::move(raw), msg), reset_at_(reset_at) {}

    ClientError::ClientError(long s, std::string u, std::optional<std::string> raw, const std::string &msg)
        : ApiError(ErrorKind::CLIENT, s, std::move(u), std::move(raw), msg) {}
}  // namespace furnilytics::http::error
