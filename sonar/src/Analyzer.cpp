#include "sonar/Analyzer.h"
#include <mutex>
#include <spdlog/spdlog.h>

namespace sonar {

PolicyAnalyzer::PolicyAnalyzer(const AnalyzerConfig& cfg, IMetricSink* metrics)
    : cfg_(cfg),
      metrics_(metrics ? metrics : &noop_),
      cache_(cfg.embedding, metrics_),
      search_(cache_),
      risk_(cfg.risk) {}

void PolicyAnalyzer::train(const Corpus& corpus) {
  std::vector<std::string> texts;
  texts.reserve(corpus.size());
  for (const auto& r : corpus) texts.push_back(r.text);

  std::unique_lock<std::shared_mutex> lock(mu_);
  cache_.train(texts);
  corpus_ = corpus;
  precomputed_.clear();
  if (cfg_.precompute_corpus) precomputed_ = cache_.precompute(texts, cfg_.search.batch_size);
  metrics_->set_gauge("sonar_corpus_size", static_cast<double>(corpus_.size()));
}

size_t PolicyAnalyzer::corpus_size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return corpus_.size();
}

AnalysisResult PolicyAnalyzer::analyze(const std::string& policy_text) const {
  return analyze(policy_text, cfg_.search.threshold);
}

AnalysisResult PolicyAnalyzer::analyze(const std::string& policy_text, double threshold) const {
  AnalysisResult out{};
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto found = search_.find_similar(policy_text, corpus_, threshold,
                                    precomputed_.empty() ? nullptr : &precomputed_,
                                    cfg_.search.batch_size);
  out.status = found.status;
  if (found.status != Status::Ok) {
    metrics_->inc_counter("sonar_analyze_total", 1, {{"status", std::string(to_string(found.status))}});
    out.assessment = risk_.assess({});
    return out;
  }
  out.matches = std::move(found.matches);
  out.assessment = risk_.assess(out.matches);

  metrics_->inc_counter("sonar_analyze_total", 1, {{"status", "ok"}});
  metrics_->observe_histogram("sonar_match_count", static_cast<double>(out.matches.size()));
  metrics_->observe_histogram("sonar_risk_score", out.assessment.score);
  spdlog::debug("analyzer: {} matches, risk {} ({:.3f})", out.matches.size(),
                to_string(out.assessment.level), out.assessment.score);
  return out;
}

} // namespace sonar
