#include "sonar/RiskScorer.h"
#include <algorithm>
#include <unordered_set>
#include <fmt/format.h>
#include "sonar/Util.h"

namespace sonar {

namespace {
const std::array<const char*, 3> kIncreaseWords = {"increase", "growth", "improve"};
const std::array<const char*, 3> kDecreaseWords = {"decrease", "reduction", "decline"};

template <size_t N>
bool contains_any(const std::string& lower, const std::array<const char*, N>& words) {
  return std::any_of(words.begin(), words.end(),
                     [&](const char* w) { return contains_lower(lower, w); });
}
} // namespace

OutcomeClass classify_outcome(const std::string& narrative) {
  const std::string lower = to_lower(narrative);
  const bool up = contains_any(lower, kIncreaseWords);
  const bool down = contains_any(lower, kDecreaseWords);
  if (up && down) return OutcomeClass::Mixed;
  if (up) return OutcomeClass::Positive;
  if (down) return OutcomeClass::Negative;
  return OutcomeClass::Mixed;
}

RiskScorer::RiskScorer(const RiskConfig& cfg) : cfg_(cfg) {}

double RiskScorer::base_score(OutcomeClass outcome, double similarity) const {
  const RiskBandScores* row = &cfg_.mixed;
  if (outcome == OutcomeClass::Negative) row = &cfg_.negative;
  else if (outcome == OutcomeClass::Positive) row = &cfg_.positive;
  if (similarity > cfg_.band_high) return row->high;
  if (similarity > cfg_.band_mid) return row->mid;
  return row->low;
}

RiskLevel RiskScorer::level_for(double score) const {
  if (score > cfg_.level_high) return RiskLevel::High;
  if (score > cfg_.level_medium) return RiskLevel::Medium;
  if (score > cfg_.level_low_medium) return RiskLevel::LowMedium;
  if (score > cfg_.level_low) return RiskLevel::Low;
  return RiskLevel::Insufficient;
}

RiskAssessment RiskScorer::assess(const std::vector<SimilarityMatch>& matches) const {
  RiskAssessment out{};
  if (matches.empty()) {
    out.recommendations.emplace_back("No historical analogs found for assessment");
    return out;
  }

  double weighted = 0.0;
  double total_similarity = 0.0;
  for (const auto& m : matches) {
    const OutcomeClass outcome = classify_outcome(m.record.outcome_narrative);
    weighted += base_score(outcome, m.score) * m.score;
    total_similarity += m.score;
    if (outcome != OutcomeClass::Positive) {
      out.factors.push_back(RiskFactor{m.record.outcome_narrative, m.record.text, m.record.year,
                                       m.record.policy_type, m.score});
    }
  }

  out.score = total_similarity > 0.0 ? weighted / total_similarity : 0.0;
  out.confidence = std::min(total_similarity / static_cast<double>(matches.size()), 1.0);
  out.level = level_for(out.score);
  out.recommendations = recommend(out.level, out.factors);
  return out;
}

std::vector<std::string> RiskScorer::recommend(RiskLevel level,
                                               const std::vector<RiskFactor>& factors) const {
  std::vector<std::string> recs;
  if (level == RiskLevel::High) {
    recs.emplace_back("Strongly consider policy redesign or mitigation strategies");
    recs.emplace_back("Implement phased rollout with monitoring checkpoints");
  } else if (level == RiskLevel::Medium) {
    recs.emplace_back("Consider targeted adjustments to high-risk aspects");
    recs.emplace_back("Establish monitoring framework for key indicators");
  }

  for (const auto& f : factors) {
    const std::string type = to_lower(f.policy_type);
    const std::string outcome = to_lower(f.narrative);
    if (contains_lower(type, "trade")) {
      recs.push_back(fmt::format("Review trade agreements from {} for lessons", f.year));
    }
    if (contains_lower(outcome, "employment") && contains_lower(outcome, "reduction")) {
      recs.emplace_back("Develop workforce transition programs");
    }
    if (contains_lower(outcome, "price") && contains_lower(outcome, "increase")) {
      recs.emplace_back("Consider price stabilization measures");
    }
  }

  if (cfg_.dedupe_recommendations) {
    std::unordered_set<std::string> seen;
    std::vector<std::string> unique;
    for (auto& r : recs) {
      if (seen.insert(r).second) unique.push_back(std::move(r));
    }
    recs = std::move(unique);
  }

  if (recs.empty()) {
    recs.emplace_back("No significant risks identified based on historical analogs");
  }
  return recs;
}

} // namespace sonar
