// ____________________________________ LICENSE ____________________________________
//
// Source repo: qtutil
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "config.hpp"

#include <fstream>
#include <regex>

#include <fkYAML/node.hpp>

#include "utility/exception.hpp"
#include "utility/filepath.hpp"


qtu::config qtu::config::from_string(std::string_view str) try {
    const fkyaml::node root = fkyaml::node::deserialize(str);

    qtu::config config;

    if (root.is_null()) return config; // empty file

    if (root.contains("version")) config.version = root.at("version").as_str();

    if (root.contains("table")) {
        const auto& table = root.at("table");

        // A blank value reads back as null, serializer is free to emit the default ' ' pad unquoted
        if (table.contains("pad") && !table.at("pad").is_null()) config.table.pad = table.at("pad").as_str();
        if (table.contains("divider") && !table.at("divider").is_null())
            config.table.divider = table.at("divider").as_str();
        if (table.contains("indent")) config.table.indent = table.at("indent").as_int();
    }

    return config;
} catch (std::exception& e) { throw qtu::exception{"Could not parse config, error:\n{}", e.what()}; }

qtu::config qtu::config::from_file(std::string_view path) {
    return qtu::config::from_string(qtu::read_file_to_string(std::string(path)));
}

std::string qtu::config::to_string() const {
    fkyaml::node root;

    root["version"]          = this->version;
    root["table"]["pad"]     = this->table.pad;
    root["table"]["divider"] = this->table.divider;
    root["table"]["indent"]  = this->table.indent;

    return fkyaml::node::serialize(root);
}

void qtu::config::to_file(std::string_view path) const {
    std::ofstream file(std::string{path});
    if (!file) throw qtu::domain_failure{"Could not open file {{ {} }} for writing", path};

    file << this->to_string();
}

// Function for validating the config & making user-friendly error messages
std::optional<std::string> qtu::config::validate() const {

    // Validate version
    if (!std::regex_match(this->version, std::regex{R"(^\d+\.\d+\.\d+$)"})) {
        constexpr auto fmt = "'version' has a value {{ {} }}, which doesn't match the schema <major>.<minor>.<patch>";
        return std::format(fmt, this->version);
    }

    // Validate table style
    if (this->table.pad.size() != 1) {
        constexpr auto fmt = "'table.pad' has a value {{ {} }}, which is not a single character";
        return std::format(fmt, this->table.pad);
    }

    if (this->table.divider.size() != 1) {
        constexpr auto fmt = "'table.divider' has a value {{ {} }}, which is not a single character";
        return std::format(fmt, this->table.divider);
    }

    if (this->table.indent < 0 || this->table.indent > max_indent) {
        constexpr auto fmt = "'table.indent' has a value {{ {} }}, which is outside of the range [0, {}]";
        return std::format(fmt, this->table.indent, max_indent);
    }

    return std::nullopt;
}

qtu::table::style qtu::config::table_style() const {
    if (const auto err = this->validate()) throw qtu::invalid_argument{"Invalid config:\n{}", err.value()};

    return {.pad     = this->table.pad.front(),
            .divider = this->table.divider.front(),
            .indent  = static_cast<std::size_t>(this->table.indent)};
}
