#ifndef FURNILYTICS_PROVIDER_HPP
#define FURNILYTICS_PROVIDER_HPP

#include <string>
#include <string_view>
#include <vector>

#include "../../config/client_config.hpp"
#include "../api/catalog_types.hpp"
#include "../model/model.hpp"

namespace furnilytics::http::provider {
    struct Paths {
        static constexpr const char* HEALTH = "/health";
        static constexpr const char* DATASETS = "/datasets";
        static constexpr const char* METADATA = "/metadata";
        static constexpr const char* DATA = "/data";
    };

    struct QueryKeys {
        static constexpr const char* FROM = "frm";
        static constexpr const char* TO = "to";
        static constexpr const char* LIMIT = "limit";
    };

    // Builds fully-qualified GET requests for the Furnilytics endpoints. Holds
    // only a const reference to the config, which must outlive it.
    class FurnilyticsProvider {
       public:
        explicit FurnilyticsProvider(const config::ClientConfig& config);

        [[nodiscard]] http::model::Request build_health() const;
        [[nodiscard]] http::model::Request build_datasets() const;
        [[nodiscard]] http::model::Request build_metadata() const;
        [[nodiscard]] http::model::Request build_metadata_one(std::string_view dataset_id) const;
        // Throws std::invalid_argument for an empty id or a non-positive limit.
        [[nodiscard]] http::model::Request build_data(std::string_view dataset_id, const api::DataQuery& query) const;

       private:
        [[nodiscard]] http::model::Request make_get(const std::string& path_and_query) const;
        [[nodiscard]] std::vector<std::string> default_headers() const;

        const config::ClientConfig& config_;
    };
}  // namespace furnilytics::http::provider

#endif
