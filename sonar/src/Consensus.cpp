#include "sonar/Consensus.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <spdlog/spdlog.h>

namespace sonar {

namespace {
size_t trimmed_length(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return e - b;
}
} // namespace

ConsensusScorer::ConsensusScorer(const ConsensusConfig& cfg) : cfg_(cfg) {}

ConsensusMetrics ConsensusScorer::summarize(const std::vector<AcademicSource>& sources,
                                            int current_year) const {
  ConsensusMetrics m{};
  uint32_t recent = 0;
  for (const auto& s : sources) {
    const double sentiment = s.sentiment.value_or(0.5);
    if (sentiment > cfg_.support_above) m.support++;
    else if (sentiment < cfg_.oppose_below) m.oppose++;
    else m.neutral++;
    if (s.year >= current_year - cfg_.recent_years) recent++;
  }
  m.total = static_cast<uint32_t>(sources.size());
  if (m.total == 0) return m;

  const double total = static_cast<double>(m.total);
  const double base = (static_cast<double>(m.support) - static_cast<double>(m.oppose)) / total;
  const double recency_boost = 1.0 + static_cast<double>(recent) / total * 0.5;
  m.confidence = std::round(base * std::min(1.0, recency_boost) * 100.0) / 100.0;
  m.recency_factor = static_cast<double>(recent) / total;
  return m;
}

std::vector<std::string> ConsensusScorer::journals(const std::vector<AcademicSource>& sources) const {
  std::set<std::string> names;
  for (const auto& s : sources) {
    if (!s.journal.empty()) names.insert(s.journal);
  }
  return {names.begin(), names.end()};
}

ConsensusResult ConsensusScorer::gather(IAcademicAnalysis& api, const std::string& policy_text,
                                        int current_year) const {
  ConsensusResult res{};
  if (trimmed_length(policy_text) < cfg_.min_text_length) {
    res.status = Status::InvalidInput;
    return res;
  }
  AcademicResult ar = api.analyze_academic(policy_text, cfg_.timeout_ms);
  res.feed_status = ar.status;
  if (ar.status != FeedStatus::Ok) {
    spdlog::error("consensus: academic analysis failed ({})", to_string(ar.status));
    return res;
  }
  res.metrics = summarize(ar.sources, current_year);
  res.journals = journals(ar.sources);
  res.sources = std::move(ar.sources);
  return res;
}

} // namespace sonar
