#include "result_adapter.hpp"

#include <simdjson.h>

#include <algorithm>
#include <array>
#include <string>

#include "../../utils/string_utils.hpp"
#include "../error/errors.hpp"

namespace furnilytics::http::api {
    std::optional<Visibility> parse_visibility(std::string_view raw) {
        if (string_utils::iequals(raw, "public")) {
            return Visibility::PUBLIC;
        }
        if (string_utils::iequals(raw, "paid")) {
            return Visibility::PAID;
        }
        if (string_utils::iequals(raw, "pro")) {
            return Visibility::PRO;
        }
        return std::nullopt;
    }

    const char* to_string(Visibility visibility) {
        switch (visibility) {
            case Visibility::PUBLIC:
                return "public";
            case Visibility::PAID:
                return "paid";
            case Visibility::PRO:
                return "pro";
        }
        return "unknown";
    }
}  // namespace furnilytics::http::api

namespace furnilytics::http::api::adapter {
    namespace {
        constexpr std::array<std::string_view, 4> HEALTHY_STATUSES = {"ok", "healthy", "up", "pass"};

        [[noreturn]] void throw_shape_error(const http::model::Response& resp, const std::string& what) {
            throw error::ClientError(resp.status_, resp.effective_url_, std::nullopt, what);
        }

        simdjson::dom::element parse_body(simdjson::dom::parser& parser, const http::model::Response& resp) {
            simdjson::dom::element doc;
            const auto err = parser.parse(resp.body_).get(doc);
            if (err != simdjson::SUCCESS) {
                throw_shape_error(resp, "Invalid JSON response (HTTP " + std::to_string(resp.status_) + "): " + simdjson::error_message(err));
            }
            return doc;
        }

        bool is_healthy_status(std::string_view status) {
            return std::ranges::any_of(HEALTHY_STATUSES, [status](std::string_view healthy) { return string_utils::iequals(status, healthy); });
        }

        // Rows either sit at the top level or under "data".
        std::optional<table::Table> rows_from(const simdjson::dom::element& doc) {
            simdjson::dom::array rows;
            if (doc.get_array().get(rows) == simdjson::SUCCESS) {
                return table::Table::from_records(rows);
            }
            simdjson::dom::object obj;
            if (doc.get_object().get(obj) == simdjson::SUCCESS && obj["data"].get_array().get(rows) == simdjson::SUCCESS) {
                return table::Table::from_records(rows);
            }
            return std::nullopt;
        }
    }  // namespace

    HealthStatus to_health(const http::model::Response& resp) {
        simdjson::dom::parser parser;
        const simdjson::dom::element doc = parse_body(parser, resp);

        HealthStatus health;
        health.ok_ = true;

        simdjson::dom::object obj;
        if (doc.get_object().get(obj) != simdjson::SUCCESS) {
            std::string_view text;
            bool flag = false;
            if (doc.get_bool().get(flag) == simdjson::SUCCESS) {
                health.ok_ = flag;
            } else if (doc.get_string().get(text) == simdjson::SUCCESS) {
                health.status_ = std::string(text);
                health.ok_ = is_healthy_status(text);
            }
            return health;
        }

        for (auto field : obj) {
            health.fields_[std::string(field.key)] = table::to_cell(field.value);
        }

        std::string_view status;
        if (obj["status"].get_string().get(status) == simdjson::SUCCESS) {
            health.status_ = std::string(status);
            health.ok_ = is_healthy_status(status);
        }

        bool ok_flag = false;
        if (obj["ok"].get_bool().get(ok_flag) == simdjson::SUCCESS) {
            health.ok_ = ok_flag;
        }

        return health;
    }

    table::Table to_records_table(const http::model::Response& resp, const char* endpoint) {
        simdjson::dom::parser parser;
        const simdjson::dom::element doc = parse_body(parser, resp);

        if (auto rows = rows_from(doc)) {
            return std::move(*rows);
        }

        // An object whose "data" is missing or null carries no rows.
        simdjson::dom::object obj;
        simdjson::dom::element data;
        if (doc.get_object().get(obj) == simdjson::SUCCESS && (obj["data"].get(data) != simdjson::SUCCESS || data.is_null())) {
            return {};
        }
        throw_shape_error(resp, std::string("Unexpected response shape from ") + endpoint);
    }

    MetadataRecord to_metadata_record(const http::model::Response& resp) {
        simdjson::dom::parser parser;
        const simdjson::dom::element doc = parse_body(parser, resp);

        simdjson::dom::object obj;
        if (doc.get_object().get(obj) != simdjson::SUCCESS) {
            throw_shape_error(resp, "Unexpected response shape from /metadata/{id}");
        }

        MetadataRecord record;
        for (auto field : obj) {
            std::string_view text;
            if (field.key == "id" && field.value.get_string().get(text) == simdjson::SUCCESS) {
                record.id_ = std::string(text);
            } else if (field.key == "visibility" && field.value.get_string().get(text) == simdjson::SUCCESS) {
                record.visibility_raw_ = std::string(text);
                record.visibility_ = parse_visibility(text);
            } else if (field.key == "meta") {
                record.meta_ = simdjson::minify(field.value);
            } else if (field.key == "schema") {
                record.schema_ = simdjson::minify(field.value);
            } else {
                record.extra_[std::string(field.key)] = simdjson::minify(field.value);
            }
        }
        return record;
    }

    table::Table to_data_table(const http::model::Response& resp) {
        simdjson::dom::parser parser;
        const simdjson::dom::element doc = parse_body(parser, resp);

        if (auto rows = rows_from(doc)) {
            return std::move(*rows);
        }
        throw_shape_error(resp, "Unexpected response shape from /data/{id}");
    }

    ResponseMeta to_response_meta(const http::model::Request& req, const http::model::Response& resp, size_t attempts) {
        ResponseMeta meta;
        meta.method_ = req.method_;
        meta.url_ = req.url_;
        meta.http_status_ = resp.status_;
        meta.etag_ = resp.etag_;
        meta.cache_control_ = resp.cache_control_;
        meta.retry_after_ = resp.retry_after_;
        meta.content_type_ = resp.content_type_;
        meta.rate_limit_remaining_ = resp.rate_limit_remaining_;
        if (resp.rate_limit_reset_) {
            meta.rate_limit_reset_ = static_cast<std::int64_t>(*resp.rate_limit_reset_);
        }
        meta.attempts_ = attempts;
        return meta;
    }
}  // namespace furnilytics::http::api::adapter
