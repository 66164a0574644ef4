// ____________________________________ LICENSE ____________________________________
//
// Source repo: qtutil
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// A custom exception class used throughout the codebase, it carries source location
// info and supports C++20 <format> strings in constructor, which makes diagnostics
// nicer. Chaining & rethrowing such exceptions can even accomplish a pseudo-stacktrace.
//
// Derived types only exist so callers can tell error categories apart in 'catch',
// they share the formatting & location logic of the base.
// _________________________________________________________________________________

#pragma once

#include <format>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

#include "utility/filepath.hpp"
#include "version.hpp"


namespace qtu {

class exception : public std::runtime_error {

    // Note: ANSI color sequences are supported by most modern terminals
    constexpr static auto format = //
        "\033[31;1m"               // bold red
        "Error   ->"               // |
        "\033[0m"                  // reset
        " "                        //
        "\033[36m"                 // cyan
        "qtu::exception"           // |
        "\033[0m"                  // reset
        " thrown at "              //
        "\033[35m"                 // magenta
        "{}"                       // |
        "\033[0m"                  // reset
        ":"                        //
        "\033[35m"                 // magenta
        "{}"                       // |
        "\033[0m"                  // reset
        " in function "            //
        "\033[35m"                 // magenta
        "{}"                       // |
        "\033[0m"                  // reset
        "\n"                       //
        "\033[31;1m"               // bold red
        "Message ->"               // |
        "\033[0m"                  // reset
        " {}";                     //

public:
    // Required API
    exception(std::string_view message, std::source_location loc = std::source_location::current())
        : std::runtime_error(
              std::format(format, qtu::trim_filepath(loc.file_name()), loc.line(), loc.function_name(), message)) {}

    exception(const exception& other) noexcept : std::runtime_error(other) {}

    [[nodiscard]] const char* what() const noexcept override { return std::runtime_error::what(); }

    // Constructors with fmt
    // clang-format off
    template <class T1>
    exception(std::format_string<T1> fmt, T1&& arg1,
              std::source_location loc = std::source_location::current())
        : exception(std::format(fmt, std::forward<T1>(arg1)), loc) {}

    template <class T1, class T2>
    exception(std::format_string<T1, T2> fmt, T1&& arg1, T2&& arg2,
              std::source_location loc = std::source_location::current())
        : exception(std::format(fmt, std::forward<T1>(arg1), std::forward<T2>(arg2)), loc) {}

    template <class T1, class T2, class T3>
    exception(std::format_string<T1, T2, T3> fmt, T1&& arg1, T2&& arg2, T3&& arg3,
              std::source_location loc = std::source_location::current())
        : exception(std::format(fmt, std::forward<T1>(arg1), std::forward<T2>(arg2), std::forward<T3>(arg3)), loc) {}
    // clang-format on
};

// Lookup of a key that isn't stored, see 'qtu::partitioned_map'
class key_not_found : public exception {
public:
    using exception::exception;
};

// Index outside of the valid range, see 'qtu::table::format()'
class out_of_range : public exception {
public:
    using exception::exception;
};

// Argument that can never be valid, see 'qtu::clamp_idx()' & 'qtu::config'
class invalid_argument : public exception {
public:
    using exception::exception;
};

// Something outside of our control (a missing file, a broken device) has failed. Such errors
// can't be fixed by changing the program, so we make them distinguishable and annotate the
// message to say so. The original message stays accessible through 'cause()'.
class domain_failure : public exception {
    std::string cause_message;

    constexpr static auto annotation = "{}\n\t(The cause of this error lies outside of {})";

public:
    domain_failure(std::string_view cause, std::source_location loc = std::source_location::current())
        : exception(std::format(annotation, cause, qtu::version::program), loc), cause_message(cause) {}

    // clang-format off
    template <class T1>
    domain_failure(std::format_string<T1> fmt, T1&& arg1,
                   std::source_location loc = std::source_location::current())
        : domain_failure(std::format(fmt, std::forward<T1>(arg1)), loc) {}

    template <class T1, class T2>
    domain_failure(std::format_string<T1, T2> fmt, T1&& arg1, T2&& arg2,
                   std::source_location loc = std::source_location::current())
        : domain_failure(std::format(fmt, std::forward<T1>(arg1), std::forward<T2>(arg2)), loc) {}
    // clang-format on

    [[nodiscard]] const std::string& cause() const noexcept { return this->cause_message; }
};

} // namespace qtu
