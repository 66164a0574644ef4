// ____________________________________ LICENSE ____________________________________
//
// Source repo: qtutil
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "utility/filepath.hpp"

#include <fstream>

#include "utility/exception.hpp"


std::string_view qtu::trim_filepath(std::string_view path) noexcept {
    return path.substr(path.find_last_of("/\\") + 1); // 'npos + 1' wraps to 0 when there are no directories
}

// More or less the fastest way of reading a text file, implementation taken from
// 'utl::json': https://github.com/DmitriBogdanov/UTL/blob/master/include/UTL/json.hpp
std::string qtu::read_file_to_string(const std::string& path) {
    std::ifstream file(path, std::ios::ate | std::ios::binary); // open file and immediately seek to the end
    // opening file as binary allows us to skip pointless newline re-encoding
    if (!file.good()) throw qtu::domain_failure{"Could not open file {{ {} }}", path};

    const auto file_size = file.tellg(); // returns cursor pos, which is the end of file
    if (file_size < 0) throw qtu::domain_failure{"Could not determine size of file {{ {} }}", path};

    file.seekg(std::ios::beg);                                   // seek to the beginning
    std::string chars(static_cast<std::size_t>(file_size), '\0'); // allocate string of appropriate size
    file.read(chars.data(), file_size);                          // read into the string
    if (!file) throw qtu::domain_failure{"Could not read file {{ {} }}", path};

    return chars;
}
