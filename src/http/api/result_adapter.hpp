#ifndef FURNILYTICS_RESULT_ADAPTER_HPP
#define FURNILYTICS_RESULT_ADAPTER_HPP

#include "../../table/table.hpp"
#include "../model/model.hpp"
#include "catalog_types.hpp"

// Turns successful (2xx) response bodies into caller-facing shapes. Shape
// mismatches raise http::error::ClientError.
namespace furnilytics::http::api::adapter {
    [[nodiscard]] HealthStatus to_health(const http::model::Response& resp);

    // /datasets and /metadata: {"data": [...]} (or a bare array).
    [[nodiscard]] table::Table to_records_table(const http::model::Response& resp, const char* endpoint);

    [[nodiscard]] MetadataRecord to_metadata_record(const http::model::Response& resp);

    // /data/{id}: a bare array of rows, or rows under "data" with the
    // envelope dropped.
    [[nodiscard]] table::Table to_data_table(const http::model::Response& resp);

    [[nodiscard]] ResponseMeta to_response_meta(const http::model::Request& req, const http::model::Response& resp, size_t attempts);
}  // namespace furnilytics::http::api::adapter

#endif
