#include "sonar/SimilaritySearch.h"
#include <algorithm>
#include <spdlog/spdlog.h>
#include "sonar/Util.h"

namespace sonar {

double cosine_similarity(const TermVector& a, const TermVector& b) {
  if (a.norm == 0.0 || b.norm == 0.0) return 0.0;
  const TermWeights& small = a.weights.size() <= b.weights.size() ? a.weights : b.weights;
  const TermWeights& large = a.weights.size() <= b.weights.size() ? b.weights : a.weights;
  double dot = 0.0;
  for (const auto& kv : small) {
    auto it = large.find(kv.first);
    if (it != large.end()) dot += kv.second * it->second;
  }
  double sim = dot / (a.norm * b.norm);
  return std::clamp(sim, 0.0, 1.0);
}

SimilaritySearch::SimilaritySearch(EmbeddingCache& cache) : cache_(cache) {}

SearchResult SimilaritySearch::find_similar(const std::string& query, const Corpus& corpus,
                                            double threshold,
                                            const PrecomputedVectors* precomputed,
                                            size_t batch_size) const {
  SearchResult res{};
  if (is_blank(query)) {
    spdlog::debug("similarity_search: rejected blank query");
    res.status = Status::InvalidInput;
    return res;
  }
  if (corpus.empty()) return res;

  // Query and records are all weighted against one table, even if a retrain lands mid-search.
  const TablePtr table = cache_.weighting().snapshot();
  VectorPtr qv = cache_.get_or_compute(query, table);

  // Resolve record vectors: precomputed first, the rest through the cache in batches.
  std::vector<VectorPtr> vecs(corpus.size());
  std::vector<std::string> pending_texts;
  std::vector<size_t> pending_idx;
  for (size_t i = 0; i < corpus.size(); ++i) {
    if (precomputed) {
      auto it = precomputed->find(corpus[i].text);
      if (it != precomputed->end() && it->second &&
          it->second->generation == table->generation) {
        vecs[i] = it->second;
        continue;
      }
    }
    pending_texts.push_back(corpus[i].text);
    pending_idx.push_back(i);
  }
  if (!pending_texts.empty()) {
    auto computed = cache_.get_batch(pending_texts, batch_size, table);
    for (size_t j = 0; j < computed.size(); ++j) vecs[pending_idx[j]] = computed[j];
  }

  for (size_t i = 0; i < corpus.size(); ++i) {
    double score = cosine_similarity(*qv, *vecs[i]);
    if (score >= threshold) res.matches.push_back(SimilarityMatch{corpus[i], score});
  }
  std::stable_sort(res.matches.begin(), res.matches.end(),
                   [](const SimilarityMatch& a, const SimilarityMatch& b) {
                     return a.score > b.score;
                   });
  spdlog::debug("similarity_search: {} of {} records at or above {:.3f}", res.matches.size(),
                corpus.size(), threshold);
  return res;
}

} // namespace sonar
