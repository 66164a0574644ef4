// ____________________________________ LICENSE ____________________________________
//
// Source repo: qtutil
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Program name & version, the build platform is only reported by '--version'.
// _________________________________________________________________________________

#pragma once

#include <string>

#include <fmt/format.h>
#include <UTL/predef.hpp>


namespace qtu {

struct version {
    constexpr static int major = 0;
    constexpr static int minor = 1;
    constexpr static int patch = 0;

    constexpr static auto program = "qtutil";

    // Also the default 'version' of the config
    static std::string semantic() { return fmt::format("{}.{}.{}", major, minor, patch); }

    // Shown by '--version', e.g. "qtutil 0.1.0 (Linux x86-64)"
    static std::string banner() {
        return fmt::format("{} {} ({} {})", program, semantic(), utl::predef::platform_name,
                           utl::predef::architecture_name);
    }
};

} // namespace qtu
