#include "text/csv_reader.hpp"

#include <utility>

namespace docgate::text {

std::vector<CsvRow> parse_csv(const std::string& data, const std::size_t max_rows,
                              const char separator) {
    std::vector<CsvRow> rows;
    CsvRow row;
    std::string field;
    bool in_quotes = false;
    bool row_has_content = false;

    auto finish_row = [&]() {
        row.push_back(std::move(field));
        field.clear();
        rows.push_back(std::move(row));
        row.clear();
        row_has_content = false;
    };

    for (std::size_t i = 0; i < data.size() && rows.size() < max_rows; ++i) {
        const char c = data[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < data.size() && data[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        if (c == '"') {
            in_quotes = true;
            row_has_content = true;
        } else if (c == separator) {
            row.push_back(std::move(field));
            field.clear();
            row_has_content = true;
        } else if (c == '\r') {
            continue;
        } else if (c == '\n') {
            if (row_has_content) {
                finish_row();
            }
        } else {
            field.push_back(c);
            row_has_content = true;
        }
    }

    if (rows.size() < max_rows && (row_has_content || !field.empty())) {
        finish_row();
    }
    return rows;
}

}  // namespace docgate::text
