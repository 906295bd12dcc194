#include <catch2/catch.hpp>

#include <algorithm>
#include <atomic>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../../src/furnilytics.hpp"
#include "mock_http_client.hpp"

using namespace furnilytics;
using furnilytics::config::ClientOptions;
using furnilytics::config::MapEnvironment;
using furnilytics::test::network_failure;
using furnilytics::test::reply;

namespace {
    struct Fixture {
        std::shared_ptr<test::Script> script = std::make_shared<test::Script>();
        test::RecordingSleeper sleeper;
        MapEnvironment env;

        std::unique_ptr<Client> make_client(ClientOptions options = {}) {
            return make_client_with(test::scripted_factory(script), std::move(options));
        }

        std::unique_ptr<Client> make_client_with(http::client::HttpClientFactory factory, ClientOptions options = {}) {
            if (!options.base_url_) {
                options.base_url_ = "https://api.test";
            }
            return std::make_unique<Client>(options, env, std::move(factory), sleeper.sleeper());
        }

        // Scripted transports, counting how many the client asks for.
        http::client::HttpClientFactory counting_factory(std::shared_ptr<std::atomic<int>> made) {
            auto inner = test::scripted_factory(script);
            return [made, inner]() {
                ++*made;
                return inner();
            };
        }
    };

    bool sent_api_key(const http::model::Request& req) {
        return std::any_of(req.headers_.begin(), req.headers_.end(), [](const std::string& h) { return h.rfind("X-API-Key:", 0) == 0; });
    }
}  // namespace

TEST_CASE("health returns the server status and records metadata", "[catalog_api]") {
    Fixture fx;
    fx.script->replies_.push_back(reply(200, R"({"status": "ok"})", {"Cache-Control: no-cache"}));
    auto client = fx.make_client();

    const auto health = client->health();

    REQUIRE(health.ok_);
    REQUIRE(fx.script->requests_.front().url_ == "https://api.test/health");

    const auto meta = client->last_response_meta();
    REQUIRE(meta.method_ == "GET");
    REQUIRE(meta.url_ == "https://api.test/health");
    REQUIRE(meta.http_status_ == 200);
    REQUIRE(meta.cache_control_ == std::string("no-cache"));
    REQUIRE(meta.attempts_ == 1);
}

TEST_CASE("keyless access to a Pro dataset raises AuthError", "[catalog_api]") {
    Fixture fx;
    fx.script->replies_.push_back(reply(401, R"({"detail": "This dataset requires a Pro API key"})"));
    auto client = fx.make_client();

    try {
        (void)client->data("macro_economics/consumer/eu_consumer_sentiment");
        FAIL("expected AuthError");
    } catch (const http::error::AuthError& e) {
        REQUIRE(e.status_ == 401);
        REQUIRE(std::string(e.what()) == "This dataset requires a Pro API key");
        REQUIRE(e.kind_ == http::error::ErrorKind::AUTH);
    }

    REQUIRE(fx.script->calls() == 1);
    REQUIRE_FALSE(sent_api_key(fx.script->requests_.front()));
    REQUIRE(client->last_response_meta().http_status_ == 401);
}

TEST_CASE("a configured key is attached to every request", "[catalog_api]") {
    Fixture fx;
    fx.script->replies_.push_back(reply(200, R"({"data": []})"));
    ClientOptions options;
    options.api_key_ = "pro-key";
    auto client = fx.make_client(options);

    (void)client->datasets();

    const auto& headers = fx.script->requests_.front().headers_;
    REQUIRE(std::find(headers.begin(), headers.end(), "X-API-Key: pro-key") != headers.end());
}

TEST_CASE("the key falls back to the environment", "[catalog_api]") {
    Fixture fx;
    fx.script->replies_.push_back(reply(200, R"({"data": []})"));
    auto client = std::make_unique<Client>(ClientOptions{.base_url_ = "https://api.test"},
                                           MapEnvironment(std::map<std::string, std::string>{{"FURNILYTICS_API_KEY", "env-key"}}),
                                           test::scripted_factory(fx.script), fx.sleeper.sleeper());

    (void)client->metadata();

    REQUIRE(sent_api_key(fx.script->requests_.front()));
    REQUIRE(client->config().api_key_ == std::string("env-key"));
}

TEST_CASE("last_response_meta reflects only the most recent call", "[catalog_api]") {
    Fixture fx;
    fx.script->replies_.push_back(reply(200, R"({"data": [{"id": "a/b/c"}]})", {"ETag: \"first\""}));
    fx.script->replies_.push_back(reply(200, R"({"data": [{"id": "a/b/c"}]})", {"ETag: \"second\""}));
    auto client = fx.make_client();

    (void)client->datasets();
    REQUIRE(client->last_response_meta().etag_ == std::string("\"first\""));

    (void)client->datasets();
    REQUIRE(client->last_response_meta().etag_ == std::string("\"second\""));
}

TEST_CASE("metadata_one returns the meta block verbatim", "[catalog_api]") {
    Fixture fx;
    fx.script->replies_.push_back(reply(
        200, R"({"id": "macro_economics/consumer/eu_consumer_sentiment", "visibility": "public", "meta": {"title": "EU consumer sentiment", "frequency": "monthly", "source": ["EC"]}})"));
    auto client = fx.make_client();

    const auto record = client->metadata_one("macro_economics/consumer/eu_consumer_sentiment");

    REQUIRE(fx.script->requests_.front().url_ == "https://api.test/metadata/macro_economics/consumer/eu_consumer_sentiment");
    REQUIRE(record.meta_ == std::string(R"({"title":"EU consumer sentiment","frequency":"monthly","source":["EC"]})"));
    REQUIRE(record.visibility_ == http::api::Visibility::PUBLIC);
    REQUIRE_FALSE(record.schema_.has_value());
}

TEST_CASE("data sends filters and returns rows", "[catalog_api]") {
    Fixture fx;
    fx.script->replies_.push_back(reply(200, R"([{"date": "2024-01-01", "value": 101.2}, {"date": "2024-02-01", "value": 99.8}])"));
    auto client = fx.make_client();

    http::api::DataQuery query;
    query.from_ = "2024-01-01";
    query.limit_ = 2;
    const auto rows = client->data("/macro_economics/consumer/eu_consumer_sentiment/", query);

    REQUIRE(fx.script->requests_.front().url_ == "https://api.test/data/macro_economics/consumer/eu_consumer_sentiment?frm=2024-01-01&limit=2");
    REQUIRE(rows.row_count() == 2);
    REQUIRE(std::get<double>(rows.at(1, "value")) == Approx(99.8));
}

TEST_CASE("invalid arguments fail before any request is sent", "[catalog_api]") {
    Fixture fx;
    auto client = fx.make_client();

    http::api::DataQuery query;
    query.limit_ = -5;
    REQUIRE_THROWS_AS(client->data("a/b/c", query), std::invalid_argument);
    REQUIRE_THROWS_AS(client->metadata_one("//"), std::invalid_argument);
    REQUIRE(fx.script->calls() == 0);
}

TEST_CASE("unknown dataset raises NotFoundError with the server message", "[catalog_api]") {
    Fixture fx;
    fx.script->replies_.push_back(reply(404, R"({"detail": "Dataset not found"})"));
    auto client = fx.make_client();

    try {
        (void)client->metadata_one("no/such/table");
        FAIL("expected NotFoundError");
    } catch (const http::error::NotFoundError& e) {
        REQUIRE(std::string(e.what()) == "Dataset not found");
        REQUIRE(e.url_ == "https://api.test/metadata/no/such/table");
    }
}

TEST_CASE("transient failures are retried transparently", "[catalog_api]") {
    Fixture fx;
    fx.script->replies_.push_back(reply(503, ""));
    fx.script->replies_.push_back(reply(502, ""));
    fx.script->replies_.push_back(reply(200, R"({"data": [{"id": "a/b/c"}]})"));
    auto client = fx.make_client();

    const auto table = client->datasets();

    REQUIRE(table.row_count() == 1);
    REQUIRE(fx.script->calls() == 3);
    REQUIRE(fx.sleeper.delays_->size() == 2);
    REQUIRE(client->last_response_meta().attempts_ == 3);
}

TEST_CASE("persistent server errors surface as ClientError", "[catalog_api]") {
    Fixture fx;
    for (int i = 0; i < 5; ++i) {
        fx.script->replies_.push_back(reply(500, ""));
    }
    ClientOptions options;
    options.max_retries_ = 2;
    auto client = fx.make_client(options);

    try {
        (void)client->datasets();
        FAIL("expected ClientError");
    } catch (const http::error::ClientError& e) {
        REQUIRE(e.status_ == 500);
        REQUIRE(std::string(e.what()) == "Server error (500).");
    }
    REQUIRE(fx.script->calls() == 3);
    REQUIRE(client->last_response_meta().attempts_ == 3);
}

TEST_CASE("exhausted rate limit raises RateLimitError with the reset time", "[catalog_api]") {
    Fixture fx;
    for (int i = 0; i < 2; ++i) {
        fx.script->replies_.push_back(reply(429, R"({"detail": "Too many requests"})", {"Retry-After: 1", "X-RateLimit-Reset: 1700000000"}));
    }
    ClientOptions options;
    options.max_retries_ = 1;
    auto client = fx.make_client(options);

    try {
        (void)client->data("a/b/c");
        FAIL("expected RateLimitError");
    } catch (const http::error::RateLimitError& e) {
        REQUIRE(e.reset_at_ == 1700000000L);
        REQUIRE(std::string(e.what()) == "Too many requests");
    }

    const auto meta = client->last_response_meta();
    REQUIRE(meta.http_status_ == 429);
    REQUIRE(meta.retry_after_ == std::string("1"));
    REQUIRE(meta.rate_limit_reset_ == std::int64_t{1700000000});
    REQUIRE(fx.sleeper.delays_->front() == std::chrono::milliseconds{1000});
}

TEST_CASE("network failures surface as NetworkError", "[catalog_api]") {
    Fixture fx;
    fx.script->replies_.push_back(network_failure());
    ClientOptions options;
    options.max_retries_ = 0;
    auto client = fx.make_client(options);

    REQUIRE_THROWS_AS(client->health(), http::error::NetworkError);

    const auto meta = client->last_response_meta();
    REQUIRE(meta.url_ == "https://api.test/health");
    REQUIRE(meta.http_status_ == 0);
}

TEST_CASE("non-JSON success bodies raise ClientError", "[catalog_api]") {
    Fixture fx;
    fx.script->replies_.push_back(reply(200, "<html>maintenance</html>"));
    auto client = fx.make_client();

    try {
        (void)client->datasets();
        FAIL("expected ClientError");
    } catch (const http::error::ClientError& e) {
        REQUIRE(std::string(e.what()) == "Invalid JSON response (HTTP 200): <html>maintenance</html>");
    }
}

TEST_CASE("an invalid base URL fails at construction", "[catalog_api]") {
    Fixture fx;
    ClientOptions options;
    options.base_url_ = "api.test";
    REQUIRE_THROWS_AS(fx.make_client(options), http::error::ConfigError);
}

TEST_CASE("transports are reused across calls", "[catalog_api]") {
    Fixture fx;
    for (int i = 0; i < 3; ++i) {
        fx.script->replies_.push_back(reply(200, "[]"));
    }
    auto made = std::make_shared<std::atomic<int>>(0);
    auto client = fx.make_client_with(fx.counting_factory(made));

    (void)client->datasets();
    (void)client->metadata();
    (void)client->datasets();

    REQUIRE(fx.script->calls() == 3);
    REQUIRE(made->load() == 1);
}

TEST_CASE("a transport that failed on the network is replaced", "[catalog_api]") {
    Fixture fx;
    fx.script->replies_.push_back(network_failure());
    fx.script->replies_.push_back(reply(200, R"({"status": "ok"})"));
    ClientOptions options;
    options.max_retries_ = 0;
    auto made = std::make_shared<std::atomic<int>>(0);
    auto client = fx.make_client_with(fx.counting_factory(made), options);

    REQUIRE_THROWS_AS(client->health(), http::error::NetworkError);
    REQUIRE(client->health().ok_);
    REQUIRE(made->load() == 2);
}

TEST_CASE("a factory that yields no transport raises NetworkError", "[catalog_api]") {
    Fixture fx;
    auto client = fx.make_client_with([]() -> std::unique_ptr<http::client::IHttpClient> { return nullptr; });

    REQUIRE_THROWS_AS(client->datasets(), http::error::NetworkError);
    REQUIRE(client->last_response_meta().url_ == "https://api.test/datasets");
    REQUIRE(fx.script->calls() == 0);
}

TEST_CASE("response meta carries the content type", "[catalog_api]") {
    Fixture fx;
    fx.script->replies_.push_back(reply(200, "[]", {"Content-Type: application/json"}));
    auto client = fx.make_client();

    (void)client->datasets();

    REQUIRE(client->last_response_meta().content_type_ == std::string("application/json"));
}

TEST_CASE("one client serves concurrent calls from many threads", "[catalog_api]") {
    constexpr int THREADS = 8;
    constexpr int CALLS_PER_THREAD = 5;

    Fixture fx;
    std::set<std::string> etags;
    for (int i = 0; i < THREADS * CALLS_PER_THREAD; ++i) {
        const std::string etag = "\"v" + std::to_string(i) + "\"";
        etags.insert(etag);
        fx.script->replies_.push_back(reply(200, R"([{"id": "a/b/c"}])", {"ETag: " + etag}));
    }
    auto made = std::make_shared<std::atomic<int>>(0);
    auto client = fx.make_client_with(fx.counting_factory(made));

    std::atomic<int> succeeded{0};
    std::atomic<int> wrong_rows{0};
    std::vector<std::thread> workers;
    workers.reserve(THREADS);
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&client, &succeeded, &wrong_rows]() {
            for (int i = 0; i < CALLS_PER_THREAD; ++i) {
                const auto rows = client->datasets();
                if (rows.row_count() != 1) {
                    ++wrong_rows;
                }
                ++succeeded;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    REQUIRE(succeeded.load() == THREADS * CALLS_PER_THREAD);
    REQUIRE(wrong_rows.load() == 0);
    REQUIRE(fx.script->calls() == static_cast<size_t>(THREADS * CALLS_PER_THREAD));
    REQUIRE(made->load() <= THREADS);

    const auto meta = client->last_response_meta();
    REQUIRE(meta.etag_.has_value());
    REQUIRE(etags.count(*meta.etag_) == 1);
}
