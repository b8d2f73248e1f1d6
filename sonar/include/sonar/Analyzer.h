#pragma once
#include <shared_mutex>
#include <string>
#include <vector>
#include "Common.h"
#include "EmbeddingCache.h"
#include "Metrics.h"
#include "RiskScorer.h"
#include "SimilaritySearch.h"
#include "TermWeighting.h"

namespace sonar {

struct AnalyzerConfig {
  EmbeddingConfig embedding{};
  SearchConfig search{};
  RiskConfig risk{};
  bool precompute_corpus{true};
};

struct AnalysisResult {
  Status status{Status::Ok};
  std::vector<SimilarityMatch> matches;
  RiskAssessment assessment{};
};

class PolicyAnalyzer {
 public:
  explicit PolicyAnalyzer(const AnalyzerConfig& cfg, IMetricSink* metrics = nullptr);

  // Retrains on the record texts; previously cached vectors are discarded.
  // Excludes concurrent analyze() calls for its duration.
  void train(const Corpus& corpus);

  AnalysisResult analyze(const std::string& policy_text) const;
  AnalysisResult analyze(const std::string& policy_text, double threshold) const;

  size_t corpus_size() const;
  EmbeddingCache& cache() { return cache_; }
  const EmbeddingCache& cache() const { return cache_; }

 private:
  AnalyzerConfig cfg_{};
  NoopMetricSink noop_{};
  IMetricSink* metrics_{nullptr};
  mutable EmbeddingCache cache_;
  SimilaritySearch search_;
  RiskScorer risk_;
  mutable std::shared_mutex mu_;
  Corpus corpus_;
  PrecomputedVectors precomputed_;
};

} // namespace sonar
