#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace sqlscope {

struct AnalysisResult;

/// Chooses which cache key to drop when the cache is over capacity.
/// Called with the cache lock held; implementations need no locking of their own.
/// Keys are inserted only once their value is complete; on_access and on_erase MUST
/// tolerate keys that were never inserted.
class EvictionPolicy {
 public:
  virtual ~EvictionPolicy() = default;
  virtual void on_insert(const std::string& key) = 0;
  virtual void on_access(const std::string& key) = 0;
  virtual void on_erase(const std::string& key) = 0;
  /// Returns the next key to evict, or nullopt when nothing is tracked.
  virtual std::optional<std::string> victim() const = 0;
};

/// Evicts the least recently inserted or accessed key.
class LruEvictionPolicy : public EvictionPolicy {
 public:
  void on_insert(const std::string& key) override;
  void on_access(const std::string& key) override;
  void on_erase(const std::string& key) override;
  std::optional<std::string> victim() const override;

 private:
  std::list<std::string> order_;
  std::unordered_map<std::string, std::list<std::string>::iterator> index_;
};

/// Fingerprint-keyed store of immutable analysis results with single-flight fills.
/// MUST run at most one computation per key at a time; concurrent callers share its result.
/// Entries still being computed are never evicted.
/// Inputs are keys and compute callbacks; side effects are limited to the cache itself.
class AnalysisCache {
 public:
  using Value = std::shared_ptr<const AnalysisResult>;
  using Compute = std::function<AnalysisResult()>;

  struct Stats {
    size_t hits = 0;
    size_t misses = 0;
    size_t evictions = 0;
  };

  /// A capacity of 0 disables eviction. A null policy selects LRU.
  explicit AnalysisCache(size_t capacity, std::unique_ptr<EvictionPolicy> policy = nullptr);
  AnalysisCache(const AnalysisCache&) = delete;
  AnalysisCache& operator=(const AnalysisCache&) = delete;

  /// Returns the cached result for key, computing it on first request.
  /// MUST rethrow a failed computation to every waiter and forget the key so it can be retried.
  Value get_or_compute(const std::string& key, const Compute& compute);
  /// Returns a completed entry without computing; nullptr when absent or still in flight.
  Value find(const std::string& key);
  size_t size() const;
  size_t capacity() const { return capacity_; }
  void clear();
  Stats stats() const;

 private:
  struct Entry {
    std::shared_future<Value> future;
    uint64_t id = 0;
  };

  /// Makes a completed entry visible to the eviction policy.
  void publish(const std::string& key, uint64_t id);
  void evict_locked();

  mutable std::mutex mutex_;
  size_t capacity_;
  std::unique_ptr<EvictionPolicy> policy_;
  std::unordered_map<std::string, Entry> entries_;
  uint64_t next_id_ = 0;
  Stats stats_;
};

}  // namespace sqlscope
