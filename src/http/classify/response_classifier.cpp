#include "response_classifier.hpp"

#include <simdjson.h>

#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/errors.hpp"
#include "../model/model.hpp"

namespace furnilytics::http::classify {
    namespace {
        bool is_success(long status) { return status >= static_cast<long>(HttpStatusCode::OK) && status < static_cast<long>(HttpStatusCode::MULTIPLE_CHOICES); }

        bool is_client_error(long status) {
            return status >= static_cast<long>(HttpStatusCode::BAD_REQUEST) && status < static_cast<long>(HttpStatusCode::INTERNAL_SERVER_ERROR);
        }

        bool is_server_error(long status) {
            return status >= static_cast<long>(HttpStatusCode::INTERNAL_SERVER_ERROR) && status <= static_cast<long>(HttpStatusCode::NETWORK_CONNECT_TIMEOUT);
        }

        std::optional<std::string> non_blank(std::string_view sv) {
            if (string_utils::trim(std::string(sv)).empty()) {
                return std::nullopt;
            }
            return std::string(sv);
        }

        // Accepts {"detail": "..."}, {"detail": {"msg": "..."}}, {"message": "..."}
        // and a bare JSON string.
        std::optional<std::string> extract_message(const simdjson::dom::element& doc) {
            simdjson::dom::object obj;
            if (doc.get_object().get(obj) != simdjson::SUCCESS) {
                std::string_view text;
                if (doc.get_string().get(text) == simdjson::SUCCESS) {
                    return non_blank(text);
                }
                return std::nullopt;
            }

            simdjson::dom::element detail;
            if (obj["detail"].get(detail) == simdjson::SUCCESS) {
                std::string_view text;
                simdjson::dom::object detail_obj;
                if (detail.get_string().get(text) == simdjson::SUCCESS) {
                    if (auto msg = non_blank(text)) {
                        return msg;
                    }
                } else if (detail.get_object().get(detail_obj) == simdjson::SUCCESS) {
                    std::string_view msg;
                    if (detail_obj["msg"].get_string().get(msg) == simdjson::SUCCESS) {
                        if (auto normalized = non_blank(msg)) {
                            return normalized;
                        }
                    }
                    return simdjson::minify(detail);
                }
            }

            std::string_view message;
            if (obj["message"].get_string().get(message) == simdjson::SUCCESS) {
                return non_blank(message);
            }
            return std::nullopt;
        }

        error::ErrorKind kind_for(long status) {
            switch (status) {
                case static_cast<long>(HttpStatusCode::UNAUTHORIZED):
                case static_cast<long>(HttpStatusCode::FORBIDDEN):
                    return error::ErrorKind::AUTH;
                case static_cast<long>(HttpStatusCode::NOT_FOUND):
                    return error::ErrorKind::NOT_FOUND;
                case static_cast<long>(HttpStatusCode::TOO_MANY_REQUESTS):
                    return error::ErrorKind::RATE_LIMIT;
                default:
                    return error::ErrorKind::CLIENT;
            }
        }

        std::string default_message(long status) {
            switch (status) {
                case static_cast<long>(HttpStatusCode::UNAUTHORIZED):
                    return "Invalid or missing API key.";
                case static_cast<long>(HttpStatusCode::FORBIDDEN):
                    return "Forbidden.";
                case static_cast<long>(HttpStatusCode::NOT_FOUND):
                    return "Resource not found.";
                case static_cast<long>(HttpStatusCode::TOO_MANY_REQUESTS):
                    return "Rate limit exceeded.";
                default:
                    break;
            }
            if (is_client_error(status)) {
                return "Client error (" + std::to_string(status) + ").";
            }
            if (is_server_error(status)) {
                return "Server error (" + std::to_string(status) + ").";
            }
            return "Unexpected HTTP status (" + std::to_string(status) + ").";
        }
    }  // namespace

    bool Classification::is_transient() const {
        if (!error_) {
            return false;
        }
        if (*error_ == error::ErrorKind::RATE_LIMIT) {
            return true;
        }
        return is_server_error(status_);
    }

    Classification classify(long status, std::string_view body) {
        Classification c;
        c.status_ = status;

        simdjson::dom::parser parser;
        simdjson::dom::element doc;
        const bool is_json = !body.empty() && parser.parse(body.data(), body.size()).get(doc) == simdjson::SUCCESS;
        if (is_json) {
            c.raw_ = simdjson::minify(doc);
        }

        if (is_success(status)) {
            if (!is_json) {
                c.error_ = error::ErrorKind::CLIENT;
                const std::string snippet = string_utils::trim(std::string(body.substr(0, constants::ERROR_SNIPPET_LENGTH)));
                c.message_ = "Invalid JSON response (HTTP " + std::to_string(status) + ")";
                c.message_ += snippet.empty() ? "." : ": " + snippet;
            }
            return c;
        }

        c.error_ = kind_for(status);
        std::optional<std::string> server_message;
        if (is_json) {
            server_message = extract_message(doc);
        }
        c.message_ = server_message.value_or(default_message(status));
        return c;
    }

    Classification classify(const http::model::Response& resp) { return classify(resp.status_, resp.body_); }

    void throw_error(const Classification& c, const http::model::Response& resp) {
        const error::ErrorKind kind = c.error_.value_or(error::ErrorKind::CLIENT);
        switch (kind) {
            case error::ErrorKind::AUTH:
                throw error::AuthError(c.status_, resp.effective_url_, c.raw_, c.message_);
            case error::ErrorKind::NOT_FOUND:
                throw error::NotFoundError(c.status_, resp.effective_url_, c.raw_, c.message_);
            case error::ErrorKind::RATE_LIMIT: {
                std::optional<long> reset_at = resp.rate_limit_reset_;
                if (!reset_at && resp.retry_after_) {
                    reset_at = string_utils::parse_long(*resp.retry_after_);
                }
                throw error::RateLimitError(c.status_, resp.effective_url_, c.raw_, reset_at, c.message_);
            }
            default:
                throw error::ClientError(c.status_, resp.effective_url_, c.raw_, c.message_);
        }
    }
}  // namespace furnilytics::http::classify
