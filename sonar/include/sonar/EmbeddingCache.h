#pragma once
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "Metrics.h"
#include "TermWeighting.h"

namespace sonar {

struct EmbeddingConfig {
  size_t cache_capacity{2048};
  size_t batch_size{50};
};

struct CacheStats {
  uint64_t hits{0};
  uint64_t misses{0};
  uint64_t computed{0};
  uint64_t batches{0};
  uint64_t evictions{0};
};

using VectorPtr = std::shared_ptr<const TermVector>;
using PrecomputedVectors = std::unordered_map<std::string, VectorPtr>;

// LRU memo of vectors keyed by exact text. Owns the TermWeighting it caches
// for so that retraining and purging happen under the same lock.
class EmbeddingCache {
 public:
  explicit EmbeddingCache(const EmbeddingConfig& cfg, IMetricSink* metrics = nullptr);

  void train(const std::vector<std::string>& documents);

  VectorPtr get_or_compute(const std::string& text);
  // Vectorizes against `table`. Cached entries are served and filled only while
  // `table` is the published one; an older table bypasses the cache.
  VectorPtr get_or_compute(const std::string& text, const TablePtr& table);

  // batch_size 0 falls back to the configured size; a configured 0 means one chunk.
  std::vector<VectorPtr> get_batch(const std::vector<std::string>& texts, size_t batch_size = 0);
  std::vector<VectorPtr> get_batch(const std::vector<std::string>& texts, size_t batch_size,
                                   const TablePtr& table);
  PrecomputedVectors precompute(const std::vector<std::string>& texts, size_t batch_size = 0);

  const TermWeighting& weighting() const { return weighting_; }
  CacheStats stats() const;
  size_t size() const;
  size_t capacity() const { return cfg_.cache_capacity; }

 private:
  struct Entry {
    std::string text;
    VectorPtr vec;
  };
  using LruList = std::list<Entry>;

  VectorPtr resolve(const std::string& text, const TablePtr& pinned);
  VectorPtr find_locked(const std::string& text);
  bool insert_locked(const std::string& text, const VectorPtr& vec);

  EmbeddingConfig cfg_{};
  NoopMetricSink noop_{};
  IMetricSink* metrics_{nullptr};
  TermWeighting weighting_;

  mutable std::mutex mu_;
  LruList lru_; // front = most recently used
  std::unordered_map<std::string, LruList::iterator> index_;
  CacheStats stats_{};
};

} // namespace sonar
