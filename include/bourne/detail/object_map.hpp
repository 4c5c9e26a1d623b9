#pragma once

/// @file object_map.hpp
/// @brief The two interchangeable object backings.
///
/// Both expose the same interface so that bourne::Object can alias either
/// one, chosen by BOURNE_PRESERVE_ORDER:
///   - OrderedMap: entries kept in insertion order, O(1) lookup through a
///     lazily built hash index once the object grows past
///     BOURNE_OBJECT_LINEAR_THRESHOLD keys
///   - HashMap: std::unordered_map, iteration order unspecified
///
/// Keys are unique: insert() on an existing key overwrites the value and
/// hands back the replaced one.

#include "../config.hpp"
#include "hash.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bourne::detail {

// ─── Insertion-ordered backing ─────────────────────────────────────────────

template <typename V>
class OrderedMap {
public:
    using value_type     = std::pair<std::string, V>;
    using storage_type   = std::vector<value_type>;
    using size_type      = size_t;
    using iterator       = typename storage_type::iterator;
    using const_iterator = typename storage_type::const_iterator;

    OrderedMap() = default;
    OrderedMap(const OrderedMap& o) : entries_(o.entries_) {}
    OrderedMap(OrderedMap&&) noexcept = default;
    OrderedMap& operator=(const OrderedMap& o) {
        if (this != &o) { entries_ = o.entries_; index_.reset(); }
        return *this;
    }
    OrderedMap& operator=(OrderedMap&&) noexcept = default;
    ~OrderedMap() = default;

    // ─── Capacity ────────────────────────────────────────────────────────
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] size_type size() const noexcept { return entries_.size(); }

    // ─── Iterators ──────────────────────────────────────────────────────
    iterator begin() noexcept { return entries_.begin(); }
    iterator end() noexcept { return entries_.end(); }
    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    // ─── Lookup ─────────────────────────────────────────────────────────

    V* find(std::string_view key) noexcept {
        const auto pos = position(key);
        return pos < entries_.size() ? &entries_[pos].second : nullptr;
    }
    const V* find(std::string_view key) const noexcept {
        const auto pos = position(key);
        return pos < entries_.size() ? &entries_[pos].second : nullptr;
    }
    [[nodiscard]] bool contains(std::string_view key) const noexcept {
        return find(key) != nullptr;
    }

    // ─── Modifiers ──────────────────────────────────────────────────────

    /// Insert or overwrite. Returns the previous value for an existing key.
    std::optional<V> insert(std::string key, V value) {
        if (V* existing = find(key)) {
            std::optional<V> previous(std::move(*existing));
            *existing = std::move(value);
            return previous;
        }
        append(std::move(key), std::move(value));
        return std::nullopt;
    }

    /// Existing value for @p key, or a default-constructed one appended.
    V& get_or_insert(std::string_view key) {
        if (V* existing = find(key)) return *existing;
        append(std::string(key), V{});
        return entries_.back().second;
    }

    bool erase(std::string_view key) {
        const auto pos = position(key);
        if (pos >= entries_.size()) return false;
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));
        // Positions shifted; the index is rebuilt on next lookup.
        index_.reset();
        return true;
    }

    void clear() noexcept {
        entries_.clear();
        index_.reset();
    }

    /// Key order does not matter for equality.
    bool operator==(const OrderedMap& other) const {
        if (size() != other.size()) return false;
        for (const auto& [key, val] : entries_) {
            const V* p = other.find(key);
            if (!p || !(*p == val)) return false;
        }
        return true;
    }
    bool operator!=(const OrderedMap& other) const { return !(*this == other); }

private:
    /// Index stores views into entries_[i].first. Any reallocation of
    /// entries_ dangles them, so the index is dropped and rebuilt.
    using index_type = std::unordered_map<std::string_view, size_type, KeyHash, KeyEqual>;

    static constexpr size_type kIndexThreshold = BOURNE_OBJECT_LINEAR_THRESHOLD;

    storage_type entries_;
    mutable std::unique_ptr<index_type> index_;

    size_type position(std::string_view key) const noexcept {
        if (entries_.size() < kIndexThreshold) {
            for (size_type i = 0; i < entries_.size(); ++i)
                if (entries_[i].first == key) return i;
            return entries_.size();
        }
        if (!index_) rebuild_index();
        auto it = index_->find(key);
        return it != index_->end() ? it->second : entries_.size();
    }

    void append(std::string key, V value) {
        const auto* old_data = entries_.data();
        entries_.emplace_back(std::move(key), std::move(value));
        if (!index_) return;
        if (entries_.data() != old_data) {
            index_.reset();
        } else {
            index_->emplace(std::string_view(entries_.back().first), entries_.size() - 1);
        }
    }

    void rebuild_index() const {
        auto idx = std::make_unique<index_type>(entries_.size() * 2);
        for (size_type i = 0; i < entries_.size(); ++i)
            (*idx)[std::string_view(entries_[i].first)] = i;
        index_ = std::move(idx);
    }
};

// ─── Hash backing ──────────────────────────────────────────────────────────

template <typename V>
class HashMap {
public:
    using storage_type   = std::unordered_map<std::string, V, KeyHash>;
    using value_type     = typename storage_type::value_type;
    using size_type      = size_t;
    using iterator       = typename storage_type::iterator;
    using const_iterator = typename storage_type::const_iterator;

    [[nodiscard]] bool empty() const noexcept { return map_.empty(); }
    [[nodiscard]] size_type size() const noexcept { return map_.size(); }

    iterator begin() noexcept { return map_.begin(); }
    iterator end() noexcept { return map_.end(); }
    const_iterator begin() const noexcept { return map_.begin(); }
    const_iterator end() const noexcept { return map_.end(); }

    // C++17 unordered_map has no heterogeneous find; lookups materialize
    // the key.
    V* find(std::string_view key) {
        auto it = map_.find(std::string(key));
        return it != map_.end() ? &it->second : nullptr;
    }
    const V* find(std::string_view key) const {
        auto it = map_.find(std::string(key));
        return it != map_.end() ? &it->second : nullptr;
    }
    [[nodiscard]] bool contains(std::string_view key) const {
        return find(key) != nullptr;
    }

    std::optional<V> insert(std::string key, V value) {
        auto [it, inserted] = map_.try_emplace(std::move(key));
        if (inserted) {
            it->second = std::move(value);
            return std::nullopt;
        }
        std::optional<V> previous(std::move(it->second));
        it->second = std::move(value);
        return previous;
    }

    V& get_or_insert(std::string_view key) {
        return map_.try_emplace(std::string(key)).first->second;
    }

    bool erase(std::string_view key) {
        return map_.erase(std::string(key)) > 0;
    }

    void clear() noexcept { map_.clear(); }

    bool operator==(const HashMap& other) const {
        if (size() != other.size()) return false;
        for (const auto& [key, val] : map_) {
            const V* p = other.find(key);
            if (!p || !(*p == val)) return false;
        }
        return true;
    }
    bool operator!=(const HashMap& other) const { return !(*this == other); }

private:
    storage_type map_;
};

} // namespace bourne::detail
