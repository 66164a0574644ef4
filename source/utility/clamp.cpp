// ____________________________________ LICENSE ____________________________________
//
// Source repo: qtutil
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "utility/clamp.hpp"

#include <algorithm>

#include "utility/exception.hpp"


std::int64_t qtu::clamp_idx(std::int64_t idx, std::int64_t stop, bool wrap) {
    if (stop <= 0) throw qtu::invalid_argument{"Index range [0, {}) is empty", stop};

    if (!wrap) return std::clamp<std::int64_t>(idx, 0, stop - 1);

    const std::int64_t remainder = idx % stop;
    return remainder < 0 ? remainder + stop : remainder;
    // C++ '%' truncates towards zero, so the remainder of a negative index has to be shifted,
    // doing it this way instead of '(idx % stop + stop) % stop' avoids overflow for huge 'stop'
}
