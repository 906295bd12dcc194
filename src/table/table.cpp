#include "table.hpp"

#include <simdjson.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <iomanip>
#include <stdexcept>
#include <string>

namespace furnilytics::table {
    namespace {
        // Column used for records that are not JSON objects.
        constexpr const char* VALUE_COLUMN = "value";
        constexpr size_t DOUBLE_BUFFER_SIZE = 32;

        std::string format_double(double value) {
            std::array<char, DOUBLE_BUFFER_SIZE> buffer{};
            const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
            if (ec != std::errc{}) {
                return std::to_string(value);
            }
            return {buffer.data(), end};
        }

        std::string csv_escape(const std::string& field) {
            if (field.find_first_of(",\"\r\n") == std::string::npos) {
                return field;
            }
            std::string out = "\"";
            for (const char c : field) {
                if (c == '"') {
                    out += '"';
                }
                out += c;
            }
            out += '"';
            return out;
        }
    }  // namespace

    Cell to_cell(const simdjson::dom::element& element) {
        switch (element.type()) {
            case simdjson::dom::element_type::NULL_VALUE:
                return std::monostate{};
            case simdjson::dom::element_type::BOOL:
                return bool(element);
            case simdjson::dom::element_type::INT64:
                return std::int64_t(element);
            case simdjson::dom::element_type::UINT64:
                return static_cast<double>(std::uint64_t(element));
            case simdjson::dom::element_type::DOUBLE:
                return double(element);
            case simdjson::dom::element_type::STRING:
                return std::string(std::string_view(element));
            case simdjson::dom::element_type::ARRAY:
            case simdjson::dom::element_type::OBJECT:
                return RawJson{simdjson::minify(element)};
        }
        return std::monostate{};
    }

    bool is_null(const Cell& cell) { return std::holds_alternative<std::monostate>(cell); }

    std::string to_display_string(const Cell& cell) {
        if (is_null(cell)) {
            return "null";
        }
        if (const auto* b = std::get_if<bool>(&cell)) {
            return *b ? "true" : "false";
        }
        if (const auto* i = std::get_if<std::int64_t>(&cell)) {
            return std::to_string(*i);
        }
        if (const auto* d = std::get_if<double>(&cell)) {
            return format_double(*d);
        }
        if (const auto* s = std::get_if<std::string>(&cell)) {
            return *s;
        }
        return std::get<RawJson>(cell).text_;
    }

    Table Table::from_records(const simdjson::dom::array& records) {
        Table table;

        for (simdjson::dom::element record : records) {
            simdjson::dom::object obj;
            if (record.get_object().get(obj) == simdjson::SUCCESS) {
                for (auto field : obj) {
                    table.add_column(std::string(field.key));
                }
            } else {
                table.add_column(VALUE_COLUMN);
            }
        }

        for (simdjson::dom::element record : records) {
            std::vector<Cell> row(table.columns_.size());
            simdjson::dom::object obj;
            if (record.get_object().get(obj) == simdjson::SUCCESS) {
                for (auto field : obj) {
                    row[table.index_.at(std::string(field.key))] = to_cell(field.value);
                }
            } else {
                row[table.index_.at(VALUE_COLUMN)] = to_cell(record);
            }
            table.rows_.push_back(std::move(row));
        }

        return table;
    }

    size_t Table::add_column(const std::string& name) {
        auto [it, inserted] = index_.try_emplace(name, columns_.size());
        if (inserted) {
            columns_.push_back(name);
        }
        return it->second;
    }

    std::optional<size_t> Table::column_index(const std::string& name) const {
        auto it = index_.find(name);
        if (it == index_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    const Cell& Table::at(size_t row, const std::string& column) const {
        const auto idx = column_index(column);
        if (!idx) {
            throw std::out_of_range("Unknown column: " + column);
        }
        return rows_.at(row).at(*idx);
    }

    void Table::write_csv(std::ostream& out) const {
        for (size_t c = 0; c < columns_.size(); ++c) {
            out << (c > 0 ? "," : "") << csv_escape(columns_[c]);
        }
        out << '\n';

        for (const auto& row : rows_) {
            for (size_t c = 0; c < row.size(); ++c) {
                out << (c > 0 ? "," : "") << (is_null(row[c]) ? std::string{} : csv_escape(to_display_string(row[c])));
            }
            out << '\n';
        }
    }

    void Table::render(std::ostream& out) const {
        std::vector<size_t> widths(columns_.size());
        for (size_t c = 0; c < columns_.size(); ++c) {
            widths[c] = columns_[c].size();
        }

        std::vector<std::vector<std::string>> cells;
        cells.reserve(rows_.size());
        for (const auto& row : rows_) {
            std::vector<std::string> rendered;
            rendered.reserve(row.size());
            for (size_t c = 0; c < row.size(); ++c) {
                rendered.push_back(to_display_string(row[c]));
                widths[c] = std::max(widths[c], rendered.back().size());
            }
            cells.push_back(std::move(rendered));
        }

        for (size_t c = 0; c < columns_.size(); ++c) {
            out << (c > 0 ? "  " : "") << std::setw(static_cast<int>(widths[c])) << columns_[c];
        }
        out << '\n';

        for (const auto& rendered : cells) {
            for (size_t c = 0; c < rendered.size(); ++c) {
                out << (c > 0 ? "  " : "") << std::setw(static_cast<int>(widths[c])) << rendered[c];
            }
            out << '\n';
        }
    }
}  // namespace furnilytics::table
