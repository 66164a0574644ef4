// ____________________________________ LICENSE ____________________________________
//
// Source repo: qtutil
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Lazy view over all subsets of a collection:
//
//    powerset({1, 2, 3}) -> {} {1} {2} {3} {1, 2} {1, 3} {2, 3} {1, 2, 3}
//
// Subsets are ordered by size and then lexicographically by position, which is the
// usual order of combinations. Elements are treated positionally, duplicates in the
// input produce duplicate subsets. The view can be iterated any number of times.
// _________________________________________________________________________________

#pragma once

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <numeric>
#include <ranges>
#include <vector>

#include "utility/exception.hpp"


namespace qtu {

template <class T>
class powerset_view {
    std::vector<T> items;

public:
    class iterator {
        const std::vector<T>*    items = nullptr;
        std::vector<std::size_t> positions{}; // positions of the current subset elements, always ascending
        bool                     done = true;

        // Advances 'positions' to the next combination of the same size, returns 'false' if there is none
        bool next_combination() {
            const std::size_t n = this->items->size();
            const std::size_t k = this->positions.size();

            for (std::size_t i = k; i-- > 0;) {
                if (this->positions[i] == i + n - k) continue; // position already at its last possible value

                ++this->positions[i];
                for (std::size_t j = i + 1; j < k; ++j) this->positions[j] = this->positions[j - 1] + 1;
                return true;
            }

            return false;
        }

    public:
        using value_type        = std::vector<T>;
        using difference_type   = std::ptrdiff_t;
        using iterator_category = std::input_iterator_tag;

        iterator() = default;

        explicit iterator(const std::vector<T>& items) : items(&items), done(false) {}

        [[nodiscard]] value_type operator*() const {
            value_type subset;
            subset.reserve(this->positions.size());
            for (const std::size_t pos : this->positions) subset.push_back((*this->items)[pos]);
            return subset;
        }

        iterator& operator++() {
            if (this->next_combination()) return *this;

            // Combinations of this size are exhausted, move on to the next size
            const std::size_t next_size = this->positions.size() + 1;

            if (next_size > this->items->size()) {
                this->done = true;
                return *this;
            }

            this->positions.resize(next_size);
            std::iota(this->positions.begin(), this->positions.end(), std::size_t{0});
            return *this;
        }

        void operator++(int) { ++*this; }

        [[nodiscard]] friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept { return it.done; }
    };

    explicit powerset_view(std::vector<T> items) : items(std::move(items)) {}

    [[nodiscard]] iterator begin() const { return iterator{this->items}; }

    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

    // Total number of subsets, '2^N', throws if that doesn't fit into 'std::size_t'
    [[nodiscard]] std::size_t size() const {
        if (this->items.size() >= std::numeric_limits<std::size_t>::digits)
            throw qtu::out_of_range{"Powerset of {} items has too many subsets to count", this->items.size()};

        return std::size_t{1} << this->items.size();
    }
};

// Copies the input range, later changes to it don't affect the view
template <std::ranges::input_range Range>
[[nodiscard]] auto powerset(Range&& range) {
    using value_type = std::ranges::range_value_t<Range>;

    std::vector<value_type> items;
    for (auto&& item : range) items.push_back(item);

    return powerset_view<value_type>{std::move(items)};
}

template <class T>
[[nodiscard]] powerset_view<T> powerset(std::initializer_list<T> items) {
    return powerset_view<T>{std::vector<T>(items)};
}

} // namespace qtu
