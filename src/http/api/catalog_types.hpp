#ifndef FURNILYTICS_CATALOG_TYPES_HPP
#define FURNILYTICS_CATALOG_TYPES_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "../../table/table.hpp"

namespace furnilytics::http::api {

    // Server-side filters for /data/{id}. Dates are YYYY-MM-DD and are sent
    // as given; the server decides whether from <= to.
    struct DataQuery {
        std::optional<std::string> from_;
        std::optional<std::string> to_;
        std::optional<long> limit_;
    };

    enum class Visibility { PUBLIC, PAID, PRO };

    [[nodiscard]] std::optional<Visibility> parse_visibility(std::string_view raw);
    [[nodiscard]] const char* to_string(Visibility visibility);

    struct HealthStatus {
        bool ok_ = false;
        std::optional<std::string> status_;
        std::map<std::string, table::Cell> fields_;
    };

    // /metadata/{id}. `meta` and `schema` are the server's JSON, minified;
    // every other top-level key lands in `extra_` the same way.
    struct MetadataRecord {
        std::optional<std::string> id_;
        std::optional<std::string> visibility_raw_;
        std::optional<Visibility> visibility_;
        std::optional<std::string> meta_;
        std::optional<std::string> schema_;
        std::map<std::string, std::string> extra_;
    };

    // The most recent exchange, replaced wholesale by every call.
    struct ResponseMeta {
        std::string method_;
        std::string url_;
        long http_status_ = 0;
        std::optional<std::string> etag_;
        std::optional<std::string> cache_control_;
        std::optional<std::string> retry_after_;
        std::optional<std::string> content_type_;
        std::optional<long> rate_limit_remaining_;
        std::optional<std::int64_t> rate_limit_reset_;
        size_t attempts_ = 0;
    };

}  // namespace furnilytics::http::api

#endif
