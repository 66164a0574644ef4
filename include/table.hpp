// ____________________________________ LICENSE ____________________________________
//
// Source repo: qtutil
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Formatting of string rows as a plain-text table with optional grouping.
// _________________________________________________________________________________

#pragma once

#include <algorithm>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <fmt/format.h>


// Rows '{a, 1, g2}', '{b, 2, g1}', '{c, 3, g2}' with headers '{Name, Value, Group}' grouped by column 2
// get formatted like this (trailing spaces omitted):
//
// Name Value
// ---- -----
//
// g1
//  b     2
//
// g2
//  a     1
//  c     3
//
// Column widths fit the widest header or cell, the divider row is widened so it is never narrower
// than the longest group label. Rows shorter than the header only emit the cells they have.

namespace qtu::table {

using row     = std::vector<std::string>;
using rows    = std::vector<row>;
using mapping = std::map<std::string, std::string>;

// Mappings are rendered as '(key, value)' rows sorted by key
using rows_input = std::variant<rows, mapping>;

struct style {
    char        pad     = ' '; // fills data cells up to the column width
    char        divider = '-'; // fills the divider row under the header
    std::size_t indent  = 1;   // spaces in front of every data cell
};

[[nodiscard]] std::string format(const rows_input&               input,
                                 const std::vector<std::string>& headers,
                                 std::optional<std::size_t>      group_by = std::nullopt,
                                 const style&                    style    = {});

// Converts any associative container into '(key, value)' rows, keys are sorted by their own natural
// ordering before being converted to text, which means '{2, 10}' sorts as numbers and not as strings
template <class Map>
[[nodiscard]] rows from_mapping(const Map& map) {
    std::vector<typename Map::const_iterator> entries;
    entries.reserve(map.size());
    for (auto it = map.begin(); it != map.end(); ++it) entries.push_back(it);

    std::ranges::sort(entries, [](const auto& lhs, const auto& rhs) { return lhs->first < rhs->first; });

    rows res;
    res.reserve(entries.size());
    for (const auto& entry : entries) res.push_back({fmt::format("{}", entry->first), fmt::format("{}", entry->second)});
    return res;
}

} // namespace qtu::table
