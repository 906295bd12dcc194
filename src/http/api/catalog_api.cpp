#include "catalog_api.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <string>
#include <utility>

#include "../../utils/constants.hpp"
#include "../classify/response_classifier.hpp"
#include "../client/curl_easy.hpp"
#include "../error/errors.hpp"
#include "result_adapter.hpp"

namespace furnilytics::http::api {
    namespace {
        client::HttpClientFactory curl_factory(const config::ClientConfig& config) {
            const long timeout_ms = config.timeout_s_ * constants::MS_PER_SECOND;
            const client::CurlOptions options{
                .timeout_ms_ = timeout_ms,
                .connect_timeout_ms_ = std::min(constants::CONNECT_TIMEOUT_MS, timeout_ms),
            };

            return [options]() -> std::unique_ptr<client::IHttpClient> {
                auto easy = std::make_unique<client::CurlEasy>(options);
                easy->enable_compression();
                easy->enable_keepalive();
                return easy;
            };
        }
    }  // namespace

    CatalogAPI::CatalogAPI(const config::ClientOptions& options) : CatalogAPI(options, config::ProcessEnvironment{}) {}

    CatalogAPI::CatalogAPI(const config::ClientOptions& options, const config::IEnvironment& env) : CatalogAPI(options, env, nullptr) {}

    CatalogAPI::CatalogAPI(const config::ClientOptions& options, const config::IEnvironment& env, client::HttpClientFactory http_client_factory,
                           client::Sleeper sleeper)
        : config_(config::resolve_config(options, env)),
          provider_(config_),
          executor_(config_.retry_policy_, std::move(sleeper)),
          http_client_factory_(http_client_factory ? std::move(http_client_factory) : curl_factory(config_)) {}

    HealthStatus CatalogAPI::health() { return adapter::to_health(execute(provider_.build_health())); }

    table::Table CatalogAPI::datasets() { return adapter::to_records_table(execute(provider_.build_datasets()), provider::Paths::DATASETS); }

    table::Table CatalogAPI::metadata() { return adapter::to_records_table(execute(provider_.build_metadata()), provider::Paths::METADATA); }

    MetadataRecord CatalogAPI::metadata_one(std::string_view dataset_id) {
        return adapter::to_metadata_record(execute(provider_.build_metadata_one(dataset_id)));
    }

    table::Table CatalogAPI::data(std::string_view dataset_id, const DataQuery& query) {
        return adapter::to_data_table(execute(provider_.build_data(dataset_id, query)));
    }

    ResponseMeta CatalogAPI::last_response_meta() const {
        std::lock_guard<std::mutex> lock(meta_mutex_);
        return last_meta_;
    }

    void CatalogAPI::record_meta(ResponseMeta meta) {
        std::lock_guard<std::mutex> lock(meta_mutex_);
        last_meta_ = std::move(meta);
    }

    std::unique_ptr<client::IHttpClient> CatalogAPI::acquire_client(const std::string& url) {
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            if (!idle_clients_.empty()) {
                std::unique_ptr<client::IHttpClient> http = std::move(idle_clients_.back());
                idle_clients_.pop_back();
                return http;
            }
        }

        std::unique_ptr<client::IHttpClient> http = http_client_factory_();
        if (http == nullptr) {
            throw error::NetworkError(url, 0, false, "HTTP client factory returned no client for " + url);
        }
        return http;
    }

    void CatalogAPI::release_client(std::unique_ptr<client::IHttpClient> http) {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        idle_clients_.push_back(std::move(http));
    }

    http::model::Response CatalogAPI::execute(const http::model::Request& req) {
        std::unique_ptr<client::IHttpClient> http;
        client::Outcome outcome;
        try {
            http = acquire_client(req.url_);
            outcome = executor_.execute(*http, req);
        } catch (const error::NetworkError& e) {
            // The transport may hold a broken connection; let it go.
            ResponseMeta meta;
            meta.method_ = req.method_;
            meta.url_ = req.url_;
            record_meta(std::move(meta));
            spdlog::debug("{} {} failed: {}", req.method_, req.url_, e.what());
            throw;
        }

        release_client(std::move(http));

        if (outcome.response_.effective_url_.empty()) {
            outcome.response_.effective_url_ = req.url_;
        }

        record_meta(adapter::to_response_meta(req, outcome.response_, outcome.attempts_));

        if (!outcome.classification_.ok()) {
            spdlog::debug("{} {} -> HTTP {} ({}): {}", req.method_, req.url_, outcome.classification_.status_,
                          error::to_string(outcome.classification_.error_.value_or(error::ErrorKind::CLIENT)), outcome.classification_.message_);
            classify::throw_error(outcome.classification_, outcome.response_);
        }

        return std::move(outcome.response_);
    }

}  // namespace furnilytics::http::api
