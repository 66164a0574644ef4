// ____________________________________ LICENSE ____________________________________
//
// Source repo: qtutil
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Struct representation of the YAML config and its parsing/serialization.
// _________________________________________________________________________________

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "table.hpp"
#include "version.hpp"


namespace qtu {

struct config {

    // --- Subclasses ---
    // ------------------

    struct table_section {
        std::string  pad     = " ";
        std::string  divider = "-";
        std::int64_t indent  = 1;
    };

    // --- Members ---
    // ---------------

    std::string version = qtu::version::semantic();

    table_section table;

    constexpr static auto default_path = ".qtutil";

    constexpr static std::int64_t max_indent = 8;

    // --- Parsing/serialization ---
    // -----------------------------

    static config from_string(std::string_view str);
    static config from_file(std::string_view path);

    std::string to_string() const;
    void        to_file(std::string_view path) const;

    std::optional<std::string> validate() const;

    // Throws 'qtu::invalid_argument' if the table section doesn't pass validation
    qtu::table::style table_style() const;
};

} // namespace qtu
