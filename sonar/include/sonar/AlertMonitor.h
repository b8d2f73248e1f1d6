#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "AlertEngine.h"
#include "Common.h"
#include "Feeds.h"
#include "Metrics.h"

namespace sonar {

struct MonitorResult {
  std::vector<Alert> alerts; // sentiment alerts first, then indicator alerts
  FeedStatus sentiment_status{FeedStatus::Ok};
  FeedStatus indicator_status{FeedStatus::Ok};
};

class AlertMonitor {
 public:
  AlertMonitor(const AlertConfig& cfg, INewsAnalysis& news, IIndicatorFeed& indicators,
               IMetricSink* metrics = nullptr);

  // Runs both checks concurrently. A failed check contributes no alerts and
  // does not stop the other one.
  MonitorResult monitor_policy(PolicyId policy_id, const std::string& policy_text,
                               const std::string& policy_type, TimeMs now, uint32_t timeout_ms);

  const AlertThresholdEngine& engine() const { return engine_; }

 private:
  CheckResult run_sentiment(PolicyId policy_id, const std::string& policy_text, TimeMs now,
                            uint32_t timeout_ms);
  CheckResult run_indicators(PolicyId policy_id, const std::string& policy_type, TimeMs now,
                             uint32_t timeout_ms);

  AlertThresholdEngine engine_;
  INewsAnalysis& news_;
  IIndicatorFeed& indicators_;
  NoopMetricSink noop_{};
  IMetricSink* metrics_{nullptr};
};

} // namespace sonar
