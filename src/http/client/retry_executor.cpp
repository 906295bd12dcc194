#include "retry_executor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <thread>

#include "../error/errors.hpp"
#include "../headers/headers.hpp"

using namespace std::chrono;

namespace furnilytics::http::client {
    namespace {
        constexpr size_t MAX_BACKOFF_SHIFT = 30;
    }

    RetryExecutor::RetryExecutor(config::RetryPolicy policy, Sleeper sleeper) : policy_(policy), sleeper_(std::move(sleeper)) {
        if (!sleeper_) {
            sleeper_ = [](milliseconds delay) { std::this_thread::sleep_for(delay); };
        }
    }

    milliseconds RetryExecutor::backoff_delay(size_t retry, std::minstd_rand& rng) const {
        const size_t shift = std::min(retry == 0 ? 0 : retry - 1, MAX_BACKOFF_SHIFT);
        const milliseconds grown = policy_.base_delay_ * (1LL << shift);
        const milliseconds capped = std::min(grown, policy_.max_delay_);

        std::uniform_int_distribution<long long> jitter(0, std::max<long long>(policy_.base_delay_.count(), 0));
        return capped + milliseconds{jitter(rng)};
    }

    milliseconds RetryExecutor::next_delay(const http::model::Response& resp, const classify::Classification& c, size_t retry,
                                           std::minstd_rand& rng) const {
        if (c.error_ == error::ErrorKind::RATE_LIMIT) {
            if (auto retry_after = headers::retry_after_seconds(resp)) {
                return duration_cast<milliseconds>(*retry_after);
            }
            if (resp.rate_limit_remaining_ == 0 && resp.rate_limit_reset_) {
                const auto now = duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
                if (*resp.rate_limit_reset_ > now) {
                    return duration_cast<milliseconds>(seconds{*resp.rate_limit_reset_ - now});
                }
            }
        }
        return backoff_delay(retry, rng);
    }

    Outcome RetryExecutor::execute(IHttpClient& http, const http::model::Request& req) const {
        std::minstd_rand rng{std::random_device{}()};
        const auto deadline = steady_clock::now() + policy_.total_timeout_;

        Outcome outcome;
        std::optional<error::NetworkError> network_error;

        for (size_t attempt = 1;; ++attempt) {
            const auto now = steady_clock::now();
            if (attempt > 1 && now >= deadline) {
                spdlog::warn("{} {}: {} ms call deadline reached, giving up after {} attempt(s)", req.method_, req.url_,
                             policy_.total_timeout_.count(), attempt - 1);
                break;
            }

            http::model::Request attempt_req = req;
            attempt_req.timeout_ = std::max(milliseconds{1}, duration_cast<milliseconds>(deadline - now));

            outcome = Outcome{};
            outcome.attempts_ = attempt;
            network_error.reset();

            try {
                outcome.response_ = http.get(attempt_req);
                outcome.classification_ = classify::classify(outcome.response_);
            } catch (const error::NetworkError& e) {
                network_error = e;
            }

            if (!network_error && !outcome.classification_.is_transient()) {
                return outcome;
            }

            if (attempt > policy_.max_retries_) {
                break;
            }

            const milliseconds delay =
                network_error ? backoff_delay(attempt, rng) : next_delay(outcome.response_, outcome.classification_, attempt, rng);

            if (steady_clock::now() + delay > deadline) {
                spdlog::warn("{} {}: next retry in {} ms would pass the {} ms call deadline, giving up after {} attempt(s)", req.method_, req.url_,
                             delay.count(), policy_.total_timeout_.count(), attempt);
                break;
            }

            if (network_error) {
                spdlog::warn("{} {} failed: {} (attempt {}/{}), retrying in {} ms", req.method_, req.url_, network_error->what(), attempt,
                             policy_.max_retries_ + 1, delay.count());
            } else {
                spdlog::warn("{} {} returned HTTP {} (attempt {}/{}), retrying in {} ms", req.method_, req.url_, outcome.classification_.status_,
                             attempt, policy_.max_retries_ + 1, delay.count());
            }
            sleeper_(delay);
        }

        if (network_error) {
            throw *network_error;
        }
        return outcome;
    }
}  // namespace furnilytics::http::client
