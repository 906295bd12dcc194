#ifndef FURNILYTICS_CLIENT_CONFIG_HPP
#define FURNILYTICS_CLIENT_CONFIG_HPP

#include <chrono>
#include <optional>
#include <string>

#include "../utils/constants.hpp"
#include "environment.hpp"

namespace furnilytics::config {
    struct RetryPolicy {
        size_t max_retries_ = constants::DEFAULT_MAX_RETRIES;
        std::chrono::milliseconds base_delay_{constants::BASE_DELAY_MS};
        std::chrono::milliseconds max_delay_{constants::MAX_DELAY_MS};
        // Upper bound on one logical call, sleeps included.
        std::chrono::milliseconds total_timeout_{constants::DEFAULT_TIMEOUT_S * constants::MS_PER_SECOND * (constants::DEFAULT_MAX_RETRIES + 1)};
    };

    // What a caller may pass explicitly; anything left empty falls back to
    // the environment and then to the built-in defaults.
    struct ClientOptions {
        std::optional<std::string> api_key_;
        std::optional<std::string> base_url_;
        std::optional<long> timeout_s_;
        std::optional<long> max_retries_;
    };

    struct ClientConfig {
        std::string base_url_ = constants::DEFAULT_BASE_URL;
        std::optional<std::string> api_key_;
        long timeout_s_ = constants::DEFAULT_TIMEOUT_S;
        std::string user_agent_ = constants::USER_AGENT;
        RetryPolicy retry_policy_;

        [[nodiscard]] bool has_api_key() const { return api_key_.has_value(); }
    };

    // Throws http::error::ConfigError on an invalid base URL or malformed
    // numeric settings. Never touches the network.
    [[nodiscard]] ClientConfig resolve_config(const ClientOptions& options, const IEnvironment& env);
}  // namespace furnilytics::config

#endif
