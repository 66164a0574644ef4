// ____________________________________ LICENSE ____________________________________
//
// Source repo: qtutil
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Associative container with keys of several types, each key type gets its own partition.
// _________________________________________________________________________________

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <initializer_list>
#include <list>
#include <optional>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "utility/exception.hpp"


// Keys that are "the same value" under different types, like two enums with a shared underlying value,
// are a classic source of bugs when stored in one map: depending on the comparison they either collide
// or trigger conversions. Here every key type lives in a separate partition, keys from different partitions
// are never compared or hashed against each other. The variant alternative of the key is only used to pick
// the partition.
//
// Layout:
//
//    partitions: tuple< optional<partition<Key1>>, optional<partition<Key2>>, ... >
//    order:      [ 1, 0 ]  <- alternatives in the order their partitions were created
//
// A partition is destroyed as soon as its last entry is erased, so an existing partition is never empty.
// Inside a partition entries keep insertion order, lookup goes through a hash index.
//
// Note: 'size()' returns the number of partitions and not the number of entries, use 'entry_count()'
//       for the latter. This matches the behavior callers of the container have been relying on.

namespace qtu {

template <class Value, class... Keys>
class partitioned_map {
    static_assert(sizeof...(Keys) > 0, "Map needs at least one key type");

public:
    using key_type    = std::variant<Keys...>;
    using mapped_type = Value;
    using value_type  = std::pair<key_type, Value>;

    template <class Key>
    constexpr static bool is_key = (std::is_same_v<Key, Keys> || ...);

private:
    template <class Key>
    class partition {
        using entry_list = std::list<std::pair<Key, Value>>;

        entry_list                                                entries{};
        std::unordered_map<Key, typename entry_list::iterator> index{};

    public:
        [[nodiscard]] bool empty() const noexcept { return this->entries.empty(); }

        [[nodiscard]] std::size_t size() const noexcept { return this->entries.size(); }

        [[nodiscard]] Value* find(const Key& key) {
            const auto it = this->index.find(key);
            return it == this->index.end() ? nullptr : &it->second->second;
        }

        [[nodiscard]] const Value* find(const Key& key) const {
            const auto it = this->index.find(key);
            return it == this->index.end() ? nullptr : &it->second->second;
        }

        void set(const Key& key, Value value) {
            if (Value* existing = this->find(key)) {
                *existing = std::move(value);
                return;
            }
            this->entries.emplace_back(key, std::move(value));
            this->index.emplace(key, std::prev(this->entries.end()));
        }

        bool erase(const Key& key) {
            const auto it = this->index.find(key);
            if (it == this->index.end()) return false;

            this->entries.erase(it->second);
            this->index.erase(it);
            return true;
        }

        template <class Func>
        void for_each(Func& func) const {
            for (const auto& [key, value] : this->entries) func(key, value);
        }
    };

    std::tuple<std::optional<partition<Keys>>...> partitions{};
    std::vector<std::size_t>                      order{};

    template <class Key>
    [[nodiscard]] constexpr static std::size_t alternative_of() noexcept {
        constexpr std::array<bool, sizeof...(Keys)> matches = {std::is_same_v<Key, Keys>...};
        return static_cast<std::size_t>(std::ranges::find(matches, true) - matches.begin());
    }

    template <class Key>
    [[nodiscard]] std::optional<partition<Key>>& partition_of() noexcept {
        return std::get<alternative_of<Key>()>(this->partitions);
    }

    template <class Key>
    [[nodiscard]] const std::optional<partition<Key>>& partition_of() const noexcept {
        return std::get<alternative_of<Key>()>(this->partitions);
    }

    // Calls 'func(partition)' for the partition with a runtime alternative 'alt'
    template <class Func>
    void visit_partition(std::size_t alt, Func& func) const {
        [&]<std::size_t... I>(std::index_sequence<I...>) {
            ((I == alt ? func(*std::get<I>(this->partitions)) : void()), ...);
        }(std::index_sequence_for<Keys...>{});
    }

    // Explicit alternative, implicit variant conversions could pick a different one for arithmetic keys
    template <class Key>
    [[nodiscard]] static key_type make_key(const Key& key) {
        return key_type{std::in_place_type<Key>, key};
    }

    template <class Key>
    [[noreturn]] static void throw_missing(const Key& key) {
        if constexpr (fmt::is_formattable<Key>::value)
            throw qtu::key_not_found{"Key {{ {} }} is not present in the map", fmt::format("{}", key)};
        else throw qtu::key_not_found{"Key of alternative {} is not present in the map", alternative_of<Key>()};
    }

public:
    partitioned_map() = default;

    partitioned_map(std::initializer_list<value_type> entries) {
        for (const auto& [key, value] : entries) this->set(key, value);
    }

    // --- Concrete key API ---
    // ------------------------

    template <class Key>
        requires is_key<Key>
    [[nodiscard]] bool contains(const Key& key) const {
        const auto& part = this->partition_of<Key>();
        return part && part->find(key);
    }

    template <class Key>
        requires is_key<Key>
    [[nodiscard]] const Value& get(const Key& key) const {
        const auto& part = this->partition_of<Key>();
        if (const Value* value = part ? part->find(key) : nullptr) return *value;
        throw_missing(key);
    }

    template <class Key>
        requires is_key<Key>
    [[nodiscard]] Value& get(const Key& key) {
        auto& part = this->partition_of<Key>();
        if (Value* value = part ? part->find(key) : nullptr) return *value;
        throw_missing(key);
    }

    template <class Key>
        requires is_key<Key>
    void set(const Key& key, Value value) {
        auto& part = this->partition_of<Key>();
        if (!part) {
            part.emplace();
            this->order.push_back(alternative_of<Key>());
        }
        part->set(key, std::move(value));
    }

    template <class Key>
        requires is_key<Key>
    void erase(const Key& key) {
        auto& part = this->partition_of<Key>();
        if (!part || !part->erase(key)) throw_missing(key);

        if (part->empty()) {
            part.reset();
            std::erase(this->order, alternative_of<Key>());
        }
    }

    // --- Variant key API ---
    // -----------------------

    [[nodiscard]] bool contains(const key_type& key) const {
        return std::visit([&](const auto& k) { return this->contains(k); }, key);
    }

    [[nodiscard]] const Value& get(const key_type& key) const {
        return std::visit([&](const auto& k) -> const Value& { return this->get(k); }, key);
    }

    [[nodiscard]] Value& get(const key_type& key) {
        return std::visit([&](const auto& k) -> Value& { return this->get(k); }, key);
    }

    void set(const key_type& key, Value value) {
        std::visit([&](const auto& k) { this->set(k, std::move(value)); }, key);
    }

    void erase(const key_type& key) {
        std::visit([&](const auto& k) { this->erase(k); }, key);
    }

    // --- Iteration ---
    // -----------------

    // Calls 'func(key, value)' with the concrete key type, partitions are visited in creation order
    template <class Func>
    void for_each(Func func) const {
        for (const std::size_t alt : this->order) {
            auto visit_entries = [&](const auto& part) { part.for_each(func); };
            this->visit_partition(alt, visit_entries);
        }
    }

    [[nodiscard]] std::vector<key_type> keys() const {
        std::vector<key_type> res;
        this->for_each([&](const auto& key, const Value&) { res.push_back(make_key(key)); });
        return res;
    }

    [[nodiscard]] std::vector<value_type> items() const {
        std::vector<value_type> res;
        this->for_each([&](const auto& key, const Value& value) { res.emplace_back(make_key(key), value); });
        return res;
    }

    // Overwrites entries that are already present
    void update(const partitioned_map& other) {
        other.for_each([&](const auto& key, const Value& value) { this->set(key, value); });
    }

    // --- Size ---
    // ------------

    // Number of partitions, not entries
    [[nodiscard]] std::size_t size() const noexcept { return this->order.size(); }

    [[nodiscard]] bool empty() const noexcept { return this->order.empty(); }

    [[nodiscard]] std::size_t entry_count() const {
        std::size_t count = 0;
        for (const std::size_t alt : this->order) {
            auto count_entries = [&](const auto& part) { count += part.size(); };
            this->visit_partition(alt, count_entries);
        }
        return count;
    }
};

} // namespace qtu
