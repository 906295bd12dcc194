#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "src/furnilytics.hpp"

namespace {
    struct Params {
        std::string api_key;
        std::string base_url;
        std::string log_level = "warn";
        std::string dataset_id;
        std::string from;
        std::string to;
        long limit = 0;
        std::string csv_path;
    };

    std::optional<std::string> non_empty(const std::string& s) {
        if (s.empty()) {
            return std::nullopt;
        }
        return s;
    }

    void print_health(const furnilytics::http::api::HealthStatus& health) {
        std::cout << "ok: " << (health.ok_ ? "true" : "false") << "\n";
        for (const auto& [key, value] : health.fields_) {
            std::cout << key << ": " << furnilytics::table::to_display_string(value) << "\n";
        }
    }

    void print_metadata_record(const furnilytics::http::api::MetadataRecord& record) {
        std::cout << "id: " << record.id_.value_or("") << "\n";
        std::cout << "visibility: " << record.visibility_raw_.value_or("") << "\n";
        std::cout << "meta: " << record.meta_.value_or("null") << "\n";
        std::cout << "schema: " << record.schema_.value_or("null") << "\n";
        for (const auto& [key, raw] : record.extra_) {
            std::cout << key << ": " << raw << "\n";
        }
    }
}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"CLI for Furnilytics API"};
    Params params{};

    app.add_option("--api-key", params.api_key, "Optional (only needed for pro datasets); defaults to $FURNILYTICS_API_KEY");
    app.add_option("--base-url", params.base_url, "API base URL; defaults to $FURNILYTICS_BASE_URL or the public endpoint");
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->default_val(params.log_level);
    app.require_subcommand(1);

    CLI::App* health_cmd = app.add_subcommand("health", "Check API health");
    CLI::App* datasets_cmd = app.add_subcommand("datasets", "List the dataset catalog");
    CLI::App* metadata_cmd = app.add_subcommand("metadata", "List metadata for all datasets");

    CLI::App* meta_cmd = app.add_subcommand("meta", "Show metadata for one dataset");
    meta_cmd->add_option("id", params.dataset_id, "Dataset id (topic/subtopic/table_id)")->required();

    CLI::App* data_cmd = app.add_subcommand("data", "Fetch rows of one dataset");
    data_cmd->add_option("id", params.dataset_id, "Dataset id (topic/subtopic/table_id)")->required();
    data_cmd->add_option("--frm", params.from, "Start date (YYYY-MM-DD)");
    data_cmd->add_option("--to", params.to, "End date (YYYY-MM-DD)");
    data_cmd->add_option("--limit", params.limit, "Maximum number of rows")->check(CLI::PositiveNumber);
    data_cmd->add_option("--csv", params.csv_path, "Write result to CSV file");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_level(spdlog::level::from_str(params.log_level));

    try {
        furnilytics::http::client::CurlGlobal curl_global;

        furnilytics::config::ClientOptions options;
        options.api_key_ = non_empty(params.api_key);
        options.base_url_ = non_empty(params.base_url);

        furnilytics::Client cli(options);

        if (health_cmd->parsed()) {
            print_health(cli.health());
        } else if (datasets_cmd->parsed()) {
            cli.datasets().render(std::cout);
        } else if (metadata_cmd->parsed()) {
            cli.metadata().render(std::cout);
        } else if (meta_cmd->parsed()) {
            print_metadata_record(cli.metadata_one(params.dataset_id));
        } else if (data_cmd->parsed()) {
            furnilytics::http::api::DataQuery query;
            query.from_ = non_empty(params.from);
            query.to_ = non_empty(params.to);
            if (params.limit > 0) {
                query.limit_ = params.limit;
            }

            const furnilytics::table::Table rows = cli.data(params.dataset_id, query);
            if (!params.csv_path.empty()) {
                std::ofstream out(params.csv_path, std::ios::trunc);
                if (!out) {
                    std::cerr << "Error: cannot open " << params.csv_path << " for writing\n";
                    return 1;
                }
                rows.write_csv(out);
                std::cout << "Wrote " << rows.row_count() << " rows to " << params.csv_path << "\n";
            } else {
                rows.render(std::cout);
            }
        }
    } catch (const furnilytics::http::error::Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 2;
    }

    return 0;
}
