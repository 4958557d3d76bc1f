// File: include/compchat/adapters/table_dir/caching_dataset_source.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "compchat/core/io/dataset_source.hpp"
#include "compchat/core/types.hpp"

namespace compchat {

// LRU + TTL cache in front of another source. Only successful fetches are
// cached; an unavailable dataset is asked again next time.
class CachingDatasetSource final : public IDatasetSource {
 public:
  CachingDatasetSource(IDatasetSource& inner, std::size_t capacity, DurationNs ttl_ns);

  Result<ComparisonTable> fetch(const DatasetId& id) override;

  std::string name() const override { return "cached(" + inner_.name() + ")"; }

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t hits() const;
  [[nodiscard]] std::size_t misses() const;

 private:
  using Clock = std::chrono::steady_clock;

  struct Entry {
    ComparisonTable table;
    Clock::time_point loaded_at;
  };

  // Most recently used at the front.
  using Lru = std::list<std::pair<DatasetId, Entry>>;

  IDatasetSource& inner_;
  const std::size_t capacity_;
  const std::chrono::nanoseconds ttl_;

  mutable std::mutex mu_;
  Lru lru_;
  std::unordered_map<DatasetId, Lru::iterator> index_;
  std::size_t hits_{0};
  std::size_t misses_{0};
};

}  // namespace compchat
