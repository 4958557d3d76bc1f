// File: src/adapters/table_dir/caching_dataset_source.cpp
#include "compchat/adapters/table_dir/caching_dataset_source.hpp"

namespace compchat {

CachingDatasetSource::CachingDatasetSource(IDatasetSource& inner,
                                           std::size_t capacity,
                                           DurationNs ttl_ns)
    : inner_(inner), capacity_(capacity), ttl_(ttl_ns) {}

Result<ComparisonTable> CachingDatasetSource::fetch(const DatasetId& id) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    const auto it = index_.find(id);
    if (it != index_.end()) {
      const bool fresh = ttl_.count() <= 0 || Clock::now() - it->second->second.loaded_at < ttl_;
      if (fresh) {
        lru_.splice(lru_.begin(), lru_, it->second);
        ++hits_;
        return Result<ComparisonTable>::ok(it->second->second.table);
      }
      lru_.erase(it->second);
      index_.erase(it);
    }
    ++misses_;
  }

  // Fetch outside the lock; two concurrent misses both load, last one wins.
  auto table_r = inner_.fetch(id);
  if (!table_r.ok() || capacity_ == 0) return table_r;

  std::lock_guard<std::mutex> lk(mu_);
  const auto it = index_.find(id);
  if (it != index_.end()) {
    lru_.erase(it->second);
    index_.erase(it);
  }
  lru_.emplace_front(id, Entry{table_r.value(), Clock::now()});
  index_[id] = lru_.begin();

  while (lru_.size() > capacity_) {
    index_.erase(lru_.back().first);
    lru_.pop_back();
  }
  return table_r;
}

std::size_t CachingDatasetSource::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return lru_.size();
}

std::size_t CachingDatasetSource::hits() const {
  std::lock_guard<std::mutex> lk(mu_);
  return hits_;
}

std::size_t CachingDatasetSource::misses() const {
  std::lock_guard<std::mutex> lk(mu_);
  return misses_;
}

}  // namespace compchat
