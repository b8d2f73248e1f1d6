#pragma once
#include <array>
#include <string>
#include <vector>
#include "Common.h"
#include "SimilaritySearch.h"

namespace sonar {

enum class OutcomeClass : uint8_t {
  Positive = 0,
  Negative = 1,
  Mixed = 2,
};

// Base risk per outcome class, indexed by similarity band.
struct RiskBandScores {
  double high{0.0};
  double mid{0.0};
  double low{0.0};
};

struct RiskConfig {
  double band_high{0.85}; // similarity > band_high
  double band_mid{0.70};  // similarity > band_mid
  RiskBandScores negative{0.90, 0.70, 0.50};
  RiskBandScores mixed{0.60, 0.40, 0.30};
  RiskBandScores positive{0.20, 0.10, 0.05};
  double level_high{0.7};
  double level_medium{0.5};
  double level_low_medium{0.3};
  double level_low{0.1};
  bool dedupe_recommendations{false};
};

struct RiskFactor {
  std::string narrative;
  std::string policy_text;
  int year{0};
  std::string policy_type;
  double similarity{0.0};
};

struct RiskAssessment {
  RiskLevel level{RiskLevel::Insufficient};
  double score{0.0};
  double confidence{0.0};
  std::vector<RiskFactor> factors;
  std::vector<std::string> recommendations;
};

OutcomeClass classify_outcome(const std::string& narrative);

class RiskScorer {
 public:
  explicit RiskScorer(const RiskConfig& cfg);

  RiskAssessment assess(const std::vector<SimilarityMatch>& matches) const;

  double base_score(OutcomeClass outcome, double similarity) const;
  RiskLevel level_for(double score) const;

 private:
  std::vector<std::string> recommend(RiskLevel level, const std::vector<RiskFactor>& factors) const;

  RiskConfig cfg_{};
};

} // namespace sonar
