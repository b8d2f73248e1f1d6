#include "sonar/EmbeddingCache.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace sonar {

EmbeddingCache::EmbeddingCache(const EmbeddingConfig& cfg, IMetricSink* metrics)
    : cfg_(cfg), metrics_(metrics ? metrics : &noop_) {}

void EmbeddingCache::train(const std::vector<std::string>& documents) {
  size_t purged = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    weighting_.train(documents);
    purged = lru_.size();
    lru_.clear();
    index_.clear();
  }
  if (purged > 0) {
    spdlog::warn("embedding_cache: retrain purged {} cached vectors", purged);
  }
  metrics_->set_gauge("sonar_embedding_cache_size", 0.0);
}

VectorPtr EmbeddingCache::find_locked(const std::string& text) {
  auto it = index_.find(text);
  if (it == index_.end()) return nullptr;
  lru_.splice(lru_.begin(), lru_, it->second);
  return it->second->vec;
}

bool EmbeddingCache::insert_locked(const std::string& text, const VectorPtr& vec) {
  if (cfg_.cache_capacity == 0) return false;
  lru_.push_front(Entry{text, vec});
  index_[text] = lru_.begin();
  bool evicted = false;
  while (lru_.size() > cfg_.cache_capacity) {
    index_.erase(lru_.back().text);
    lru_.pop_back();
    stats_.evictions++;
    evicted = true;
  }
  return evicted;
}

VectorPtr EmbeddingCache::get_or_compute(const std::string& text) {
  return resolve(text, nullptr);
}

VectorPtr EmbeddingCache::get_or_compute(const std::string& text, const TablePtr& table) {
  return resolve(text, table);
}

VectorPtr EmbeddingCache::resolve(const std::string& text, const TablePtr& pinned) {
  for (;;) {
    TablePtr table = pinned;
    bool current = false;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (!table) table = weighting_.snapshot();
      current = table->generation == weighting_.generation();
      if (current) {
        if (auto hit = find_locked(text)) {
          stats_.hits++;
          metrics_->inc_counter("sonar_embedding_cache_hit_total", 1);
          return hit;
        }
      }
      stats_.misses++;
    }
    metrics_->inc_counter("sonar_embedding_cache_miss_total", 1);

    auto vec = std::make_shared<const TermVector>(vectorize(text, *table));

    bool evicted = false;
    {
      std::lock_guard<std::mutex> lock(mu_);
      stats_.computed++;
      if (table->generation != weighting_.generation()) {
        // A pinned caller gets exactly the table it asked for; everyone else
        // recomputes against the table a concurrent retrain just published.
        if (pinned) return vec;
        continue;
      }
      if (auto raced = find_locked(text)) return raced;
      evicted = insert_locked(text, vec);
    }
    if (evicted) metrics_->inc_counter("sonar_embedding_cache_eviction_total", 1);
    return vec;
  }
}

std::vector<VectorPtr> EmbeddingCache::get_batch(const std::vector<std::string>& texts,
                                                 size_t batch_size) {
  return get_batch(texts, batch_size, nullptr);
}

std::vector<VectorPtr> EmbeddingCache::get_batch(const std::vector<std::string>& texts,
                                                 size_t batch_size, const TablePtr& table) {
  size_t chunk = batch_size > 0 ? batch_size : cfg_.batch_size;
  if (chunk == 0) chunk = std::max<size_t>(texts.size(), 1);

  std::vector<VectorPtr> out;
  out.reserve(texts.size());
  for (size_t start = 0; start < texts.size(); start += chunk) {
    const size_t end = std::min(texts.size(), start + chunk);
    for (size_t i = start; i < end; ++i) out.push_back(resolve(texts[i], table));
    {
      std::lock_guard<std::mutex> lock(mu_);
      stats_.batches++;
    }
  }
  metrics_->set_gauge("sonar_embedding_cache_size", static_cast<double>(size()));
  return out;
}

PrecomputedVectors EmbeddingCache::precompute(const std::vector<std::string>& texts,
                                              size_t batch_size) {
  auto vecs = get_batch(texts, batch_size);
  PrecomputedVectors out;
  out.reserve(texts.size());
  for (size_t i = 0; i < texts.size(); ++i) out.emplace(texts[i], vecs[i]);
  return out;
}

CacheStats EmbeddingCache::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

size_t EmbeddingCache::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return lru_.size();
}

} // namespace sonar
