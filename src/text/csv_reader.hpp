#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docgate::text {

using CsvRow = std::vector<std::string>;

// RFC 4180 reader: quoted fields may contain separators, doubled quotes and
// line breaks. Reads at most `max_rows` rows.
std::vector<CsvRow> parse_csv(const std::string& data, std::size_t max_rows,
                              char separator = ',');

}  // namespace docgate::text
