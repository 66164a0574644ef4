// ____________________________________ LICENSE ____________________________________
//
// Source repo: qtutil
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Index clamping into a half-open range [0, stop), same convention as iterator ranges.
// _________________________________________________________________________________

#pragma once

#include <cstdint>


namespace qtu {

// Wraps 'idx' around the range when 'wrap' is set (negative indices count from the back),
// saturates it to the closest bound otherwise. Throws 'qtu::invalid_argument' for 'stop <= 0'.
[[nodiscard]] std::int64_t clamp_idx(std::int64_t idx, std::int64_t stop, bool wrap = true);

} // namespace qtu
