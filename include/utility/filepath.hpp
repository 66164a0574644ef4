// ____________________________________ LICENSE ____________________________________
//
// Source repo: qtutil
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// File helpers shared by config & table description parsing.
// _________________________________________________________________________________

#pragma once

#include <string>
#include <string_view>


namespace qtu {

// File name without its directories, used to keep exception locations short
[[nodiscard]] std::string_view trim_filepath(std::string_view path) noexcept;

// Throws 'qtu::domain_failure' when the file can't be opened or read
[[nodiscard]] std::string read_file_to_string(const std::string& path);

} // namespace qtu
