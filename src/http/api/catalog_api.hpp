#ifndef FURNILYTICS_CATALOG_API_HPP
#define FURNILYTICS_CATALOG_API_HPP

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../../config/client_config.hpp"
#include "../../config/environment.hpp"
#include "../../table/table.hpp"
#include "../client/interface.hpp"
#include "../client/retry_executor.hpp"
#include "../model/model.hpp"
#include "../provider/furnilytics.hpp"
#include "catalog_types.hpp"

namespace furnilytics::http::api {

    // Public entry point for the Furnilytics catalog.
    //
    // Every operation is synchronous: build the request, run it with retries,
    // classify the status, then adapt the body. Failures throw the typed
    // errors of http/error/errors.hpp.
    //
    // Calls may come from several threads. Each call borrows an idle
    // transport, or a fresh one from the factory, and hands it back
    // afterwards so keep-alive connections carry over between calls. A
    // transport that hit a NetworkError is discarded instead.
    // last_response_meta() is last-writer-wins across
    // concurrent calls, so only read it as "my call" when calls do not
    // overlap.
    //
    // The default constructor path uses libcurl, which needs a live
    // http::client::CurlGlobal.
    class CatalogAPI {
       public:
        explicit CatalogAPI(const config::ClientOptions& options = {});
        CatalogAPI(const config::ClientOptions& options, const config::IEnvironment& env);
        CatalogAPI(const config::ClientOptions& options, const config::IEnvironment& env, client::HttpClientFactory http_client_factory,
                   client::Sleeper sleeper = {});

        ~CatalogAPI() = default;
        CatalogAPI(const CatalogAPI&) = delete;
        CatalogAPI& operator=(const CatalogAPI&) = delete;
        CatalogAPI(CatalogAPI&&) = delete;
        CatalogAPI& operator=(CatalogAPI&&) = delete;

        HealthStatus health();
        table::Table datasets();
        table::Table metadata();
        MetadataRecord metadata_one(std::string_view dataset_id);
        table::Table data(std::string_view dataset_id, const DataQuery& query = {});

        [[nodiscard]] ResponseMeta last_response_meta() const;
        [[nodiscard]] const config::ClientConfig& config() const { return config_; }

       private:
        // Returns only 2xx responses; anything else has already been thrown.
        http::model::Response execute(const http::model::Request& req);
        void record_meta(ResponseMeta meta);

        std::unique_ptr<client::IHttpClient> acquire_client(const std::string& url);
        void release_client(std::unique_ptr<client::IHttpClient> http);

        const config::ClientConfig config_;
        const provider::FurnilyticsProvider provider_;
        const client::RetryExecutor executor_;
        client::HttpClientFactory http_client_factory_;

        std::mutex pool_mutex_;
        std::vector<std::unique_ptr<client::IHttpClient>> idle_clients_;

        mutable std::mutex meta_mutex_;
        ResponseMeta last_meta_;
    };

}  // namespace furnilytics::http::api

namespace furnilytics {
    using Client = http::api::CatalogAPI;
}

#endif
