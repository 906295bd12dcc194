#include "furnilytics.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "../url/url.hpp"

namespace furnilytics::http::provider {
    FurnilyticsProvider::FurnilyticsProvider(const config::ClientConfig& config) : config_(config) {}

    std::vector<std::string> FurnilyticsProvider::default_headers() const {
        std::vector<std::string> headers = {"Accept: application/json", "User-Agent: " + config_.user_agent_};
        if (config_.api_key_) {
            headers.push_back("X-API-Key: " + *config_.api_key_);
        }
        return headers;
    }

    http::model::Request FurnilyticsProvider::make_get(const std::string& path_and_query) const {
        http::model::Request r;
        r.url_ = config_.base_url_ + path_and_query;
        r.headers_ = default_headers();
        r.method_ = "GET";
        return r;
    }

    http::model::Request FurnilyticsProvider::build_health() const { return make_get(Paths::HEALTH); }

    http::model::Request FurnilyticsProvider::build_datasets() const { return make_get(Paths::DATASETS); }

    http::model::Request FurnilyticsProvider::build_metadata() const { return make_get(Paths::METADATA); }

    http::model::Request FurnilyticsProvider::build_metadata_one(std::string_view dataset_id) const {
        return make_get(std::string(Paths::METADATA) + "/" + url::encode_path_segments(dataset_id));
    }

    http::model::Request FurnilyticsProvider::build_data(std::string_view dataset_id, const api::DataQuery& query) const {
        std::vector<std::pair<std::string, std::string>> params;
        if (query.from_) {
            params.emplace_back(QueryKeys::FROM, *query.from_);
        }
        if (query.to_) {
            params.emplace_back(QueryKeys::TO, *query.to_);
        }
        if (query.limit_) {
            if (*query.limit_ <= 0) {
                throw std::invalid_argument("limit must be a positive integer, got " + std::to_string(*query.limit_));
            }
            params.emplace_back(QueryKeys::LIMIT, std::to_string(*query.limit_));
        }

        return make_get(std::string(Paths::DATA) + "/" + url::encode_path_segments(dataset_id) + url::build_query(params));
    }
}  // namespace furnilytics::http::provider
