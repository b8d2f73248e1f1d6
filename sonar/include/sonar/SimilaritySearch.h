#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "Common.h"
#include "EmbeddingCache.h"
#include "TermWeighting.h"

namespace sonar {

struct SearchConfig {
  double threshold{0.5};
  size_t batch_size{50};
};

struct SimilarityMatch {
  PolicyRecord record;
  double score{0.0};
};

struct SearchResult {
  Status status{Status::Ok};
  std::vector<SimilarityMatch> matches;
};

// Cosine of the angle between two TF-IDF vectors, 0 when either is empty.
double cosine_similarity(const TermVector& a, const TermVector& b);

class SimilaritySearch {
 public:
  explicit SimilaritySearch(EmbeddingCache& cache);

  // Matches with score >= threshold, best first; equal scores keep corpus order.
  SearchResult find_similar(const std::string& query, const Corpus& corpus, double threshold,
                            const PrecomputedVectors* precomputed = nullptr,
                            size_t batch_size = 0) const;

 private:
  EmbeddingCache& cache_;
};

} // namespace sonar
