// ____________________________________ LICENSE ____________________________________
//
// Source repo: qtutil
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// YAML description of a table that can be passed to 'qtutil table'. Rows are either
// a sequence of sequences, or a mapping that gets rendered as '(key, value)' rows sorted by key:
//
//    headers: [Name, Group, Value]     headers: [Key, Value]
//    group_by: 1                       rows:
//    rows:                               alpha: 1
//      - [a, g1, 1]                      beta: true
//      - [b, g2, 2]
// _________________________________________________________________________________

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "table.hpp"


namespace qtu {

struct table_input {
    std::vector<std::string>   headers  = {};
    qtu::table::rows_input     rows     = qtu::table::rows{};
    std::optional<std::size_t> group_by = std::nullopt;

    static table_input from_string(std::string_view str);
    static table_input from_file(std::string_view path);

    [[nodiscard]] std::string format(const qtu::table::style& style = {}) const;
};

} // namespace qtu
