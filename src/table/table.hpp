#ifndef FURNILYTICS_TABLE_HPP
#define FURNILYTICS_TABLE_HPP

#include <simdjson.h>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace furnilytics::table {
    // Nested arrays/objects are kept as minified JSON text.
    struct RawJson {
        std::string text_;

        bool operator==(const RawJson& other) const = default;
    };

    using Cell = std::variant<std::monostate, bool, std::int64_t, double, std::string, RawJson>;

    [[nodiscard]] Cell to_cell(const simdjson::dom::element& element);
    [[nodiscard]] bool is_null(const Cell& cell);
    [[nodiscard]] std::string to_display_string(const Cell& cell);

    // Row-oriented table. Columns are the union of keys across all records
    // in first-seen order; a record without a column holds a null cell.
    class Table {
       public:
        Table() = default;

        static Table from_records(const simdjson::dom::array& records);

        [[nodiscard]] const std::vector<std::string>& columns() const { return columns_; }
        [[nodiscard]] const std::vector<std::vector<Cell>>& rows() const { return rows_; }
        [[nodiscard]] size_t row_count() const { return rows_.size(); }
        [[nodiscard]] size_t column_count() const { return columns_.size(); }
        [[nodiscard]] bool empty() const { return rows_.empty(); }

        [[nodiscard]] std::optional<size_t> column_index(const std::string& name) const;

        // Throws std::out_of_range for an unknown column or row.
        [[nodiscard]] const Cell& at(size_t row, const std::string& column) const;

        void write_csv(std::ostream& out) const;
        void render(std::ostream& out) const;

       private:
        size_t add_column(const std::string& name);

        std::vector<std::string> columns_;
        std::unordered_map<std::string, size_t> index_;
        std::vector<std::vector<Cell>> rows_;
    };
}  // namespace furnilytics::table

#endif
