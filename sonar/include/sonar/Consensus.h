#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "Common.h"
#include "Feeds.h"

namespace sonar {

struct ConsensusConfig {
  double support_above{0.7};
  double oppose_below{0.3};
  int recent_years{5};
  size_t min_text_length{50};
  uint32_t timeout_ms{10000};
};

struct ConsensusMetrics {
  uint32_t support{0};
  uint32_t oppose{0};
  uint32_t neutral{0};
  double confidence{0.0};
  uint32_t total{0};
  double recency_factor{0.0};
};

struct ConsensusResult {
  Status status{Status::Ok};
  FeedStatus feed_status{FeedStatus::Ok};
  ConsensusMetrics metrics{};
  std::vector<std::string> journals; // sorted, unique
  std::vector<AcademicSource> sources;
};

class ConsensusScorer {
 public:
  explicit ConsensusScorer(const ConsensusConfig& cfg);

  ConsensusMetrics summarize(const std::vector<AcademicSource>& sources, int current_year) const;
  std::vector<std::string> journals(const std::vector<AcademicSource>& sources) const;

  ConsensusResult gather(IAcademicAnalysis& api, const std::string& policy_text,
                         int current_year) const;

 private:
  ConsensusConfig cfg_{};
};

} // namespace sonar
