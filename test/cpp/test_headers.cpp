#include <catch2/catch.hpp>

#include <chrono>
#include <ctime>
#include <string>

#include "../../src/http/headers/headers.hpp"
#include "../../src/http/model/model.hpp"

using namespace furnilytics::http;

namespace {
    void feed(model::Response& resp, const std::string& line) { headers::apply_header_line(line.data(), line.size(), resp); }

    std::string http_date(std::time_t at) {
        std::tm utc{};
        gmtime_r(&at, &utc);
        char buf[64];
        const size_t n = std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &utc);
        return std::string(buf, n);
    }
}  // namespace

TEST_CASE("extract_header_value matches names case-insensitively and trims the value", "[headers]") {
    const std::string line = "ETag:   \"abc123\"  \r\n";
    std::optional<std::string> etag;
    REQUIRE(headers::extract_header_value(line.data(), line.size(), headers::HeaderKeys::ETAG, etag));
    REQUIRE(etag == std::string("\"abc123\""));

    const std::string other = "Content-Length: 10\r\n";
    std::optional<std::string> untouched;
    REQUIRE_FALSE(headers::extract_header_value(other.data(), other.size(), headers::HeaderKeys::ETAG, untouched));
    REQUIRE_FALSE(untouched.has_value());
}

TEST_CASE("numeric header values that do not parse are ignored", "[headers]") {
    const std::string line = "X-RateLimit-Remaining: lots\r\n";
    std::optional<long> remaining;
    REQUIRE_FALSE(headers::extract_header_value(line.data(), line.size(), headers::HeaderKeys::X_RATELIMIT_REMAINING, remaining));
    REQUIRE_FALSE(remaining.has_value());
}

TEST_CASE("apply_header_line fills every recognized field", "[headers]") {
    model::Response resp;
    feed(resp, "HTTP/2 200\r\n");
    feed(resp, "content-type: application/json\r\n");
    feed(resp, "ETAG: W/\"v2\"\r\n");
    feed(resp, "Cache-Control: max-age=60\r\n");
    feed(resp, "Retry-After: 3\r\n");
    feed(resp, "x-ratelimit-remaining: 0\r\n");
    feed(resp, "X-RateLimit-Reset: 1700000000\r\n");
    feed(resp, "\r\n");

    REQUIRE(resp.content_type_ == std::string("application/json"));
    REQUIRE(resp.etag_ == std::string("W/\"v2\""));
    REQUIRE(resp.cache_control_ == std::string("max-age=60"));
    REQUIRE(resp.retry_after_ == std::string("3"));
    REQUIRE(resp.rate_limit_remaining_ == 0L);
    REQUIRE(resp.rate_limit_reset_ == 1700000000L);
}

TEST_CASE("a new status line drops headers from an earlier redirect hop", "[headers]") {
    model::Response resp;
    feed(resp, "HTTP/1.1 301 Moved Permanently\r\n");
    feed(resp, "ETag: \"old\"\r\n");
    feed(resp, "HTTP/1.1 200 OK\r\n");
    REQUIRE_FALSE(resp.etag_.has_value());

    feed(resp, "ETag: \"new\"\r\n");
    REQUIRE(resp.etag_ == std::string("\"new\""));
}

TEST_CASE("retry_after_seconds reads delta-seconds and HTTP-dates", "[headers]") {
    model::Response resp;
    REQUIRE_FALSE(headers::retry_after_seconds(resp).has_value());

    SECTION("delta-seconds") {
        resp.retry_after_ = "2";
        REQUIRE(headers::retry_after_seconds(resp) == std::chrono::seconds{2});
    }

    SECTION("an HTTP-date in the past means no wait") {
        resp.retry_after_ = "Wed, 21 Oct 2015 07:28:00 GMT";
        REQUIRE(headers::retry_after_seconds(resp) == std::chrono::seconds{0});
    }

    SECTION("an HTTP-date in the future is the time left until it") {
        resp.retry_after_ = http_date(std::time(nullptr) + 120);
        const auto wait = headers::retry_after_seconds(resp);
        REQUIRE(wait.has_value());
        REQUIRE(*wait >= std::chrono::seconds{115});
        REQUIRE(*wait <= std::chrono::seconds{120});
    }

    SECTION("negative or unparseable values are ignored") {
        resp.retry_after_ = "-1";
        REQUIRE_FALSE(headers::retry_after_seconds(resp).has_value());

        resp.retry_after_ = "later";
        REQUIRE_FALSE(headers::retry_after_seconds(resp).has_value());
    }
}
