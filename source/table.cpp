// ____________________________________ LICENSE ____________________________________
//
// Source repo: qtutil
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "table.hpp"

#include <UTL/stre.hpp>

#include "utility/exception.hpp"


namespace {

// Ordered container makes groups come out in natural string order, with the unnamed group first
using groups_type = std::map<std::string, qtu::table::rows>;

[[nodiscard]] qtu::table::rows normalize(const qtu::table::rows_input& input) {
    if (const auto* mapping = std::get_if<qtu::table::mapping>(&input)) return qtu::table::from_mapping(*mapping);
    return std::get<qtu::table::rows>(input);
}

[[nodiscard]] groups_type split_into_groups(qtu::table::rows rows, std::vector<std::string>& headers,
                                            std::optional<std::size_t> group_by) {
    groups_type groups;

    if (!group_by) {
        groups[""] = std::move(rows);
        return groups;
    }

    const std::size_t column = *group_by;

    if (column >= headers.size())
        throw qtu::out_of_range{"Grouping column {} is out of range for a table with {} headers", column,
                                headers.size()};

    headers.erase(headers.begin() + column);

    for (std::size_t i = 0; i < rows.size(); ++i) {
        auto& row = rows[i];

        if (column >= row.size())
            throw qtu::out_of_range{"Row {} has {} cells and no grouping column {}", i, row.size(), column};

        std::string group = std::move(row[column]);
        row.erase(row.begin() + column);

        groups[std::move(group)].push_back(std::move(row));
    }

    return groups;
}

class table_serializer {
    std::string str{};

    std::vector<std::size_t> widths{};

    const qtu::table::style& style;

public:
    table_serializer(const std::vector<std::string>& headers, const groups_type& groups,
                     const qtu::table::style& style)
        : style(style) {
        // Columns fit the widest header or cell, rows without a cell in some column don't affect its width
        this->widths.reserve(headers.size());
        for (const auto& header : headers) this->widths.push_back(header.size());

        for (const auto& [group, rows] : groups)
            for (const auto& row : rows)
                for (std::size_t col = 0; col < std::min(row.size(), this->widths.size()); ++col)
                    this->widths[col] = std::max(this->widths[col], row[col].size());
    }

    // Each cell is followed by a single space separator, if 'min_width' is larger than the row,
    // the trailing separator gets replaced by padding that stretches the row to exactly 'min_width'
    void serialize_row(const qtu::table::row& row, char pad, std::size_t indent, std::size_t min_width = 0) {
        const std::size_t row_start = this->str.size();
        const std::size_t columns   = std::min(row.size(), this->widths.size());

        for (std::size_t col = 0; col < columns; ++col) {
            this->str.append(indent, ' ');
            this->str += utl::stre::pad_right(row[col], this->widths[col], pad);
            this->str += ' ';
        }

        const std::size_t row_width = this->str.size() - row_start;

        if (row_width < min_width) {
            if (columns) this->str.pop_back();
            this->str.append(min_width - row_width + (columns ? 1 : 0), pad);
        }

        this->str += '\n';
    }

    std::string serialize(const std::vector<std::string>& headers, const groups_type& groups) {
        this->str.clear();

        // Header & divider
        std::size_t group_width = 0;
        for (const auto& [group, rows] : groups) group_width = std::max(group_width, group.size());

        this->serialize_row(headers, ' ', 0);
        this->serialize_row(qtu::table::row(headers.size()), this->style.divider, 0, group_width + 1);

        // Body
        for (const auto& [group, rows] : groups) {
            if (!group.empty()) {
                this->str += '\n';
                this->str += group;
                this->str += '\n';
            }

            for (const auto& row : rows) this->serialize_row(row, this->style.pad, this->style.indent);
        }

        return std::move(this->str);
    }
};

} // namespace

std::string qtu::table::format(const rows_input& input, const std::vector<std::string>& headers,
                               std::optional<std::size_t> group_by, const style& style) {
    std::vector<std::string> columns = headers;

    const groups_type groups = split_into_groups(normalize(input), columns, group_by);

    table_serializer serializer{columns, groups, style};

    return serializer.serialize(columns, groups);
}
