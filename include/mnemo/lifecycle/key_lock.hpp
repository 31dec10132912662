#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <mutex>
#include <string_view>
#include <vector>

namespace mnemo::lifecycle {

/// Fixed table of mutexes indexed by key hash. Two keys may share a shard;
/// that only serializes them further.
class key_lock final {
 public:
  explicit key_lock(std::size_t shards = 64)
      : mutexes_(std::max<std::size_t>(shards, 1)) {}

  key_lock(const key_lock&) = delete;
  key_lock& operator=(const key_lock&) = delete;

  std::unique_lock<std::mutex> lock(const std::string_view key) {
    return std::unique_lock<std::mutex>{mutexes_[shard(key)]};
  }

  /// Locks every shard touched by `keys` in ascending shard order.
  template <typename Keys>
  std::vector<std::unique_lock<std::mutex>> lock_all(const Keys& keys) {
    auto indices = std::vector<std::size_t>{};
    for (const auto& key : keys) {
      indices.push_back(shard(key));
    }
    std::sort(std::begin(indices), std::end(indices));
    indices.erase(std::unique(std::begin(indices), std::end(indices)),
                  std::end(indices));
    auto locks = std::vector<std::unique_lock<std::mutex>>{};
    locks.reserve(indices.size());
    for (auto index : indices) {
      locks.emplace_back(mutexes_[index]);
    }
    return locks;
  }

 private:
  std::size_t shard(const std::string_view key) const {
    return std::hash<std::string_view>{}(key) % mutexes_.size();
  }

  std::vector<std::mutex> mutexes_;
};

}  // namespace mnemo::lifecycle
