#include "client_config.hpp"

#include <spdlog/spdlog.h>

#include <string>

#include "../http/error/errors.hpp"
#include "../http/url/url.hpp"
#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"

namespace furnilytics::config {
    namespace {
        std::optional<std::string> pick(const std::optional<std::string>& explicit_value, const IEnvironment& env, const char* env_key) {
            if (explicit_value) {
                return explicit_value;
            }
            return env.get(env_key);
        }

        long resolve_number(const std::optional<long>& explicit_value, const IEnvironment& env, const char* env_key, long fallback, long min_value,
                            long max_value) {
            long value = fallback;
            if (explicit_value) {
                value = *explicit_value;
            } else if (auto raw = env.get(env_key); raw && !string_utils::trim(*raw).empty()) {
                const auto parsed = string_utils::parse_long(*raw);
                if (!parsed) {
                    throw http::error::ConfigError(std::string(env_key) + " is not an integer: '" + *raw + "'");
                }
                value = *parsed;
            }

            if (value < min_value || value > max_value) {
                throw http::error::ConfigError(std::string(env_key) + " must be between " + std::to_string(min_value) + " and " +
                                               std::to_string(max_value) + ", got " + std::to_string(value));
            }
            return value;
        }
    }  // namespace

    ClientConfig resolve_config(const ClientOptions& options, const IEnvironment& env) {
        ClientConfig config;

        // An empty key means public access, not "look elsewhere".
        if (auto api_key = pick(options.api_key_, env, constants::ENV_API_KEY)) {
            std::string trimmed = string_utils::trim(*api_key);
            if (!trimmed.empty()) {
                config.api_key_ = std::move(trimmed);
            }
        }

        std::string base_url = constants::DEFAULT_BASE_URL;
        if (auto candidate = pick(options.base_url_, env, constants::ENV_BASE_URL); candidate && !string_utils::trim(*candidate).empty()) {
            base_url = string_utils::trim(*candidate);
        }
        while (base_url.size() > 1 && base_url.back() == '/') {
            base_url.pop_back();
        }
        if (!http::url::is_absolute_http_url(base_url)) {
            throw http::error::ConfigError("Invalid base URL: '" + base_url + "' (expected an absolute http(s) URL)");
        }
        config.base_url_ = std::move(base_url);

        config.timeout_s_ = resolve_number(options.timeout_s_, env, constants::ENV_TIMEOUT_S, constants::DEFAULT_TIMEOUT_S, 1, constants::MAX_TIMEOUT_S);

        const long max_retries =
            resolve_number(options.max_retries_, env, constants::ENV_MAX_RETRIES, constants::DEFAULT_MAX_RETRIES, 0, constants::MAX_RETRIES_LIMIT);

        config.retry_policy_.max_retries_ = static_cast<size_t>(max_retries);
        config.retry_policy_.total_timeout_ = std::chrono::milliseconds{config.timeout_s_ * constants::MS_PER_SECOND * (max_retries + 1)};

        spdlog::debug("furnilytics config: base_url={} api_key={} timeout_s={} max_retries={}", config.base_url_,
                      config.has_api_key() ? "set" : "absent", config.timeout_s_, max_retries);

        return config;
    }
}  // namespace furnilytics::config
