// ____________________________________ LICENSE ____________________________________
//
// Source repo: qtutil
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "table_input.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

#include <fkYAML/node.hpp>
#include <fmt/format.h>

#include "utility/exception.hpp"
#include "utility/filepath.hpp"


namespace {

// Cells are plain text, but YAML resolves unquoted scalars like '1' or 'true' to other types
[[nodiscard]] std::string scalar_to_string(const fkyaml::node& node) {
    if (node.is_string()) return node.as_str();
    if (node.is_integer()) return fmt::format("{}", node.as_int());
    if (node.is_float_number()) return fmt::format("{}", node.as_float());
    if (node.is_boolean()) return node.as_bool() ? "true" : "false";
    if (node.is_null()) return "";

    throw qtu::exception{"Table cells should be scalars, got a sequence or a mapping instead"};
}

[[nodiscard]] std::vector<std::string> parse_row(const fkyaml::node& node) {
    if (!node.is_sequence()) throw qtu::exception{"Each table row should be a sequence of cells"};

    std::vector<std::string> row;
    for (const auto& cell : node.as_seq()) row.push_back(scalar_to_string(cell));
    return row;
}

// Keys are ordered by their YAML type first (null, then numbers, then strings) and by value within it
[[nodiscard]] int key_rank(const fkyaml::node& key) {
    if (key.is_null()) return 0;
    if (key.is_boolean() || key.is_integer() || key.is_float_number()) return 1;
    if (key.is_string()) return 2;

    throw qtu::exception{"Mapping keys should be scalars, got a sequence or a mapping instead"};
}

[[nodiscard]] double key_number(const fkyaml::node& key) {
    if (key.is_boolean()) return key.as_bool() ? 1.0 : 0.0;
    if (key.is_integer()) return static_cast<double>(key.as_int());
    return key.as_float();
}

[[nodiscard]] bool key_less(const fkyaml::node& lhs, const fkyaml::node& rhs) {
    const int lhs_rank = key_rank(lhs);
    const int rhs_rank = key_rank(rhs);

    if (lhs_rank != rhs_rank) return lhs_rank < rhs_rank;
    if (lhs_rank == 2) return lhs.as_str() < rhs.as_str();
    if (lhs_rank == 1) {
        if (lhs.is_integer() && rhs.is_integer()) return lhs.as_int() < rhs.as_int(); // exact for large values
        return key_number(lhs) < key_number(rhs);
    }
    return false;
}

// Mapping rows are sorted by their typed keys, converting keys to text first would put '10' before '2'
[[nodiscard]] qtu::table::rows parse_mapping_rows(const fkyaml::node& node) {
    std::vector<std::pair<fkyaml::node, fkyaml::node>> entries;
    for (const auto& [key, value] : node.as_map()) entries.emplace_back(key, value);

    std::ranges::stable_sort(entries, key_less, [](const auto& entry) -> const fkyaml::node& { return entry.first; });

    qtu::table::rows rows;
    rows.reserve(entries.size());
    for (const auto& [key, value] : entries) rows.push_back({scalar_to_string(key), scalar_to_string(value)});
    return rows;
}

} // namespace

qtu::table_input qtu::table_input::from_string(std::string_view str) try {
    const fkyaml::node root = fkyaml::node::deserialize(str);

    if (!root.is_mapping()) throw qtu::exception{"Table description should be a mapping"};
    if (!root.contains("headers")) throw qtu::exception{"Table description has no 'headers'"};

    qtu::table_input input;

    input.headers = parse_row(root.at("headers"));

    if (root.contains("group_by")) {
        const std::int64_t group_by = root.at("group_by").as_int();
        if (group_by < 0) throw qtu::exception{"'group_by' has a negative value {{ {} }}", group_by};
        input.group_by = static_cast<std::size_t>(group_by);
    }

    if (root.contains("rows")) {
        const auto& rows = root.at("rows");

        if (rows.is_mapping()) {
            input.rows = parse_mapping_rows(rows);
        } else if (rows.is_sequence()) {
            qtu::table::rows sequence;
            for (const auto& row : rows.as_seq()) sequence.push_back(parse_row(row));
            input.rows = std::move(sequence);
        } else if (!rows.is_null()) {
            throw qtu::exception{"'rows' should be a sequence of rows or a mapping"};
        }
    }

    return input;
} catch (std::exception& e) { throw qtu::exception{"Could not parse table description, error:\n{}", e.what()}; }

qtu::table_input qtu::table_input::from_file(std::string_view path) {
    return qtu::table_input::from_string(qtu::read_file_to_string(std::string(path)));
}

std::string qtu::table_input::format(const qtu::table::style& style) const {
    return qtu::table::format(this->rows, this->headers, this->group_by, style);
}
