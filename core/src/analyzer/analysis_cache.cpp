#include "sqlscope/analysis_cache.h"

#include <chrono>
#include <exception>

#include "sqlscope/analyzer.h"

namespace sqlscope {

void LruEvictionPolicy::on_insert(const std::string& key) {
  auto it = index_.find(key);
  if (it != index_.end()) {
    order_.erase(it->second);
  }
  order_.push_front(key);
  index_[key] = order_.begin();
}

void LruEvictionPolicy::on_access(const std::string& key) {
  auto it = index_.find(key);
  if (it == index_.end()) return;
  order_.splice(order_.begin(), order_, it->second);
}

void LruEvictionPolicy::on_erase(const std::string& key) {
  auto it = index_.find(key);
  if (it == index_.end()) return;
  order_.erase(it->second);
  index_.erase(it);
}

std::optional<std::string> LruEvictionPolicy::victim() const {
  if (order_.empty()) return std::nullopt;
  return order_.back();
}

AnalysisCache::AnalysisCache(size_t capacity, std::unique_ptr<EvictionPolicy> policy)
    : capacity_(capacity), policy_(std::move(policy)) {
  if (!policy_) {
    policy_ = std::make_unique<LruEvictionPolicy>();
  }
}

AnalysisCache::Value AnalysisCache::get_or_compute(const std::string& key,
                                                   const Compute& compute) {
  std::promise<Value> promise;
  std::shared_future<Value> future;
  uint64_t id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
      ++stats_.hits;
      policy_->on_access(key);
      future = it->second.future;
    } else {
      ++stats_.misses;
      future = promise.get_future().share();
      id = ++next_id_;
      entries_.emplace(key, Entry{future, id});
    }
  }
  if (id == 0) {
    return future.get();
  }

  // The owning caller computes outside the lock; waiters block on the shared future.
  Value value;
  try {
    value = std::make_shared<const AnalysisResult>(compute());
  } catch (...) {
    // Forget the key before publishing the failure so find() never observes it.
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = entries_.find(key);
      if (it != entries_.end() && it->second.id == id) {
        entries_.erase(it);
        policy_->on_erase(key);
      }
    }
    promise.set_exception(std::current_exception());
    throw;
  }
  promise.set_value(value);
  publish(key, id);
  return value;
}

void AnalysisCache::publish(const std::string& key, uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  // A clear() during the computation already dropped the entry.
  if (it == entries_.end() || it->second.id != id) return;
  policy_->on_insert(key);
  evict_locked();
}

AnalysisCache::Value AnalysisCache::find(const std::string& key) {
  std::shared_future<Value> future;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return nullptr;
    future = it->second.future;
    if (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return nullptr;
    policy_->on_access(key);
  }
  return future.get();
}

size_t AnalysisCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void AnalysisCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& entry : entries_) {
    policy_->on_erase(entry.first);
  }
  entries_.clear();
}

AnalysisCache::Stats AnalysisCache::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

/// Only completed entries are known to the policy, so an in-flight key is never a victim.
/// The cache may run above capacity while more computations are in flight than it holds.
void AnalysisCache::evict_locked() {
  if (capacity_ == 0) return;
  while (entries_.size() > capacity_) {
    std::optional<std::string> victim = policy_->victim();
    if (!victim.has_value()) return;
    entries_.erase(*victim);
    policy_->on_erase(*victim);
    ++stats_.evictions;
  }
}

}  // namespace sqlscope
