#ifndef FURNILYTICS_RETRY_EXECUTOR_HPP
#define FURNILYTICS_RETRY_EXECUTOR_HPP

#include <chrono>
#include <functional>
#include <random>

#include "../../config/client_config.hpp"
#include "../classify/response_classifier.hpp"
#include "../model/model.hpp"
#include "interface.hpp"

namespace furnilytics::http::client {
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    struct Outcome {
        http::model::Response response_;
        classify::Classification classification_;
        size_t attempts_ = 0;
    };

    // Runs a request through an IHttpClient, retrying transient outcomes
    // (429, 5xx, NetworkError) with exponential backoff plus jitter. A
    // Retry-After on a 429 replaces the computed delay. Each attempt is
    // handed the time left before the per-call deadline as its transfer
    // budget. The last outcome is surfaced once retries or the deadline run
    // out: the last response is returned, or the last NetworkError rethrown.
    class RetryExecutor {
       public:
        explicit RetryExecutor(config::RetryPolicy policy, Sleeper sleeper = {});

        Outcome execute(IHttpClient& http, const http::model::Request& req) const;

        // Delay before retry number `retry` (1-based): min(base * 2^(retry-1), cap) + U[0, base].
        [[nodiscard]] std::chrono::milliseconds backoff_delay(size_t retry, std::minstd_rand& rng) const;

        [[nodiscard]] std::chrono::milliseconds next_delay(const http::model::Response& resp, const classify::Classification& c, size_t retry,
                                                           std::minstd_rand& rng) const;

       private:
        config::RetryPolicy policy_;
        Sleeper sleeper_;
    };
}  // namespace furnilytics::http::client

#endif
