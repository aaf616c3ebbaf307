#pragma once

#include <sift/core/record.hpp>
#include <sift/core/value.hpp>

#include <robin_hood.h>

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace sift::view {

/// Records partitioned by key, keys kept in first-seen order.
///
/// Within a group records keep their original relative order.
template <typename K, typename Hash = std::hash<K>, typename Eq = std::equal_to<K>>
class GroupMap {
   public:
    using key_type = K;

    struct Entry {
        K key;
        std::vector<RecordPtr> records;
    };

    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }

    [[nodiscard]] auto begin() const noexcept { return entries_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return entries_.cend(); }

    [[nodiscard]] auto entries() const noexcept -> const std::vector<Entry>& { return entries_; }

    /// Records under `key`, or nullptr if no record produced that key.
    [[nodiscard]] auto find(const K& key) const -> const std::vector<RecordPtr>* {
        if (auto it = index_.find(key); it != index_.end()) {
            return &entries_[it->second].records;
        }
        return nullptr;
    }

    [[nodiscard]] auto contains(const K& key) const -> bool { return find(key) != nullptr; }

    [[nodiscard]] auto keys() const -> std::vector<K> {
        std::vector<K> out;
        out.reserve(entries_.size());
        for (const auto& entry : entries_) {
            out.push_back(entry.key);
        }
        return out;
    }

    void append(K key, RecordPtr record) {
        if (auto it = index_.find(key); it != index_.end()) {
            entries_[it->second].records.push_back(std::move(record));
            return;
        }
        index_.emplace(key, entries_.size());
        entries_.push_back(Entry{.key = std::move(key), .records = {std::move(record)}});
    }

   private:
    std::vector<Entry> entries_;
    robin_hood::unordered_flat_map<K, std::size_t, Hash, Eq> index_;
};

/// Groups keyed by raw field value; null is a valid key.
using Groups = GroupMap<Value, ValueHash, ValueEq>;

/// Groups keyed by a typed field value; nullopt is the null key.
template <typename T>
using TypedGroups = GroupMap<std::optional<T>>;

}  // namespace sift::view
