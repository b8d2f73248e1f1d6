#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "Common.h"

namespace sonar {

// Falling: a band is crossed when value <= limit. Rising mirrors it (value >= limit).
enum class BandDirection : uint8_t {
  Falling = 0,
  Rising = 1,
};

struct ThresholdBands {
  double warning{0.0};
  double alert{0.0};
  double critical{0.0};
  BandDirection direction{BandDirection::Falling};
  bool enabled{true};
};

struct AlertConfig {
  ThresholdBands sentiment{-0.15, -0.25, -0.40, BandDirection::Falling};
  ThresholdBands inflation{0.01, 0.02, 0.03, BandDirection::Rising};   // monthly
  ThresholdBands gdp{-0.003, -0.006, -0.01, BandDirection::Falling};   // quarterly
  // Off unless a deployment turns them on.
  ThresholdBands employment{-0.005, -0.01, -0.02, BandDirection::Falling, false};
  ThresholdBands trade{-0.02, -0.05, -0.10, BandDirection::Falling, false};
  double decay_window_days{30.0};
  double neutral_baseline{0.5};
  std::string timeframe{"30d"};
};

struct NewsSource {
  std::string date; // ISO-8601
  double sentiment{0.5};
};

struct IndicatorSnapshot {
  std::map<AlertKind, double> changes;
};

struct Alert {
  std::string id;
  PolicyId policy_id{0};
  AlertKind kind{AlertKind::Sentiment};
  std::string metric;
  double current_value{0.0};
  double threshold{0.0};
  AlertSeverity severity{AlertSeverity::Info};
  std::string message;
  std::vector<std::string> related_indicators;
  std::string timestamp;
};

struct SentimentAggregate {
  FeedStatus status{FeedStatus::Ok};
  std::optional<double> mean{}; // empty when no source carries weight
  size_t used_sources{0};
};

struct CheckResult {
  FeedStatus status{FeedStatus::Ok};
  std::vector<Alert> alerts;
};

const char* metric_name(AlertKind kind);
std::vector<std::string> related_indicators(AlertKind kind);

class AlertThresholdEngine {
 public:
  explicit AlertThresholdEngine(const AlertConfig& cfg);

  const ThresholdBands* bands_for(AlertKind kind) const;

  // Most severe crossed band wins; empty when the warning band is not crossed.
  std::optional<AlertSeverity> resolve_severity(AlertKind kind, double value,
                                                bool positive_is_good) const;

  std::optional<Alert> evaluate(PolicyId policy_id, AlertKind kind, const std::string& metric,
                                double value, bool positive_is_good, TimeMs now) const;

  SentimentAggregate aggregate_sentiment(const std::vector<NewsSource>& sources, TimeMs now) const;

  CheckResult check_sentiment(PolicyId policy_id, const std::vector<NewsSource>& sources,
                              TimeMs now) const;
  CheckResult check_indicators(PolicyId policy_id, const IndicatorSnapshot& snapshot,
                               TimeMs now) const;

  // Kinds without their own template read "<kind> changed by ...".
  std::string message_for(AlertKind kind, double value, double threshold) const;

  const AlertConfig& config() const { return cfg_; }

 private:
  AlertConfig cfg_{};
};

} // namespace sonar
