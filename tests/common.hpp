// __________________________________ CONTENTS ___________________________________
//
//    Common utils / includes / namespaces used for testing.
//    Reduces test boilerplate, should not be included anywhere else.
// _______________________________________________________________________________

// ___________________ TEST FRAMEWORK  ____________________

#define DOCTEST_CONFIG_VOID_CAST_EXPRESSIONS // makes 'CHECK_THROWS()' not give warning for discarding [[nodiscard]]
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN   // automatically creates 'main()' that runs tests
#include <doctest/doctest.h>

// ____________________ TEST HELPERS _____________________

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// Splits formatted output into lines, the terminating '\n' of the last line doesn't produce an empty line
inline std::vector<std::string> split_lines(std::string_view str) {
    std::vector<std::string> lines;

    std::size_t start = 0;
    while (start < str.size()) {
        const std::size_t end = str.find('\n', start);
        if (end == std::string_view::npos) {
            lines.emplace_back(str.substr(start));
            break;
        }
        lines.emplace_back(str.substr(start, end - start));
        start = end + 1;
    }

    return lines;
}
