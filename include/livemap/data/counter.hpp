#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace livemap::data {

/// Frequency counter over an optional categorical value.
/// Absent values share the single std::nullopt bucket.
/// Thread safety: none, single analysis pass only.
template <typename T> class Counter {
  public:
    using Key = std::optional<T>;

    /// Count one occurrence. Returns the bucket's new count.
    size_t insert(const Key &key) {
        auto [it, inserted] = counts_.try_emplace(key, 0);
        if (inserted) {
            order_.push_back(key);
        }
        return ++it->second;
    }

    [[nodiscard]] size_t count(const Key &key) const {
        const auto it = counts_.find(key);
        return it == counts_.end() ? 0 : it->second;
    }

    [[nodiscard]] size_t none_count() const { return count(std::nullopt); }

    /// Number of distinct buckets, including the no-value bucket if seen.
    [[nodiscard]] size_t size() const { return counts_.size(); }
    [[nodiscard]] bool empty() const { return counts_.empty(); }

    [[nodiscard]] size_t total() const {
        size_t sum = 0;
        for (const auto &[key, n] : counts_) {
            sum += n;
        }
        return sum;
    }

    /// Buckets by descending count; equal counts keep first-seen order.
    [[nodiscard]] std::vector<std::pair<Key, size_t>> sorted() const {
        std::vector<std::pair<Key, size_t>> out;
        out.reserve(order_.size());
        for (const auto &key : order_) {
            out.emplace_back(key, counts_.at(key));
        }
        std::stable_sort(out.begin(), out.end(),
                         [](const auto &a, const auto &b) { return a.second > b.second; });
        return out;
    }

  private:
    std::unordered_map<Key, size_t> counts_;
    std::vector<Key> order_;
};

} // namespace livemap::data
