#include "sonar/AlertMonitor.h"
#include <exception>
#include <future>
#include <iterator>
#include <spdlog/spdlog.h>

namespace sonar {

AlertMonitor::AlertMonitor(const AlertConfig& cfg, INewsAnalysis& news, IIndicatorFeed& indicators,
                           IMetricSink* metrics)
    : engine_(cfg), news_(news), indicators_(indicators), metrics_(metrics ? metrics : &noop_) {}

CheckResult AlertMonitor::run_sentiment(PolicyId policy_id, const std::string& policy_text,
                                        TimeMs now, uint32_t timeout_ms) {
  CheckResult res{};
  try {
    NewsResult news = news_.analyze_news(policy_text, timeout_ms);
    if (news.status != FeedStatus::Ok) {
      res.status = news.status;
      return res;
    }
    return engine_.check_sentiment(policy_id, news.sources, now);
  } catch (const std::exception& e) {
    spdlog::error("alert_monitor: news analysis threw for policy {}: {}", policy_id, e.what());
    res.status = FeedStatus::Failed;
  } catch (...) {
    spdlog::error("alert_monitor: news analysis threw a non-standard exception for policy {}",
                  policy_id);
    res.status = FeedStatus::Failed;
  }
  return res;
}

CheckResult AlertMonitor::run_indicators(PolicyId policy_id, const std::string& policy_type,
                                         TimeMs now, uint32_t timeout_ms) {
  CheckResult res{};
  try {
    IndicatorResult ind = indicators_.get_indicators(policy_type, engine_.config().timeframe,
                                                     timeout_ms);
    if (ind.status != FeedStatus::Ok) {
      res.status = ind.status;
      return res;
    }
    return engine_.check_indicators(policy_id, ind.snapshot, now);
  } catch (const std::exception& e) {
    spdlog::error("alert_monitor: indicator feed threw for policy {}: {}", policy_id, e.what());
    res.status = FeedStatus::Failed;
  } catch (...) {
    spdlog::error("alert_monitor: indicator feed threw a non-standard exception for policy {}",
                  policy_id);
    res.status = FeedStatus::Failed;
  }
  return res;
}

MonitorResult AlertMonitor::monitor_policy(PolicyId policy_id, const std::string& policy_text,
                                           const std::string& policy_type, TimeMs now,
                                           uint32_t timeout_ms) {
  auto sentiment = std::async(std::launch::async, [&] {
    return run_sentiment(policy_id, policy_text, now, timeout_ms);
  });
  auto indicators = std::async(std::launch::async, [&] {
    return run_indicators(policy_id, policy_type, now, timeout_ms);
  });
  CheckResult s = sentiment.get();
  CheckResult i = indicators.get();

  MonitorResult out{};
  out.sentiment_status = s.status;
  out.indicator_status = i.status;
  // Malformed indicator entries are skipped individually; keep the ones that evaluated.
  if (s.status == FeedStatus::Ok) {
    out.alerts.insert(out.alerts.end(), std::make_move_iterator(s.alerts.begin()),
                      std::make_move_iterator(s.alerts.end()));
  }
  out.alerts.insert(out.alerts.end(), std::make_move_iterator(i.alerts.begin()),
                    std::make_move_iterator(i.alerts.end()));

  if (s.status != FeedStatus::Ok) {
    spdlog::warn("alert_monitor: sentiment check for policy {} degraded ({})", policy_id,
                 to_string(s.status));
    metrics_->inc_counter("sonar_monitor_check_failed_total", 1,
                          {{"check", "sentiment"}, {"status", std::string(to_string(s.status))}});
  }
  if (i.status != FeedStatus::Ok) {
    spdlog::warn("alert_monitor: indicator check for policy {} degraded ({})", policy_id,
                 to_string(i.status));
    metrics_->inc_counter("sonar_monitor_check_failed_total", 1,
                          {{"check", "indicators"}, {"status", std::string(to_string(i.status))}});
  }
  for (const auto& a : out.alerts) {
    metrics_->inc_counter("sonar_alert_total", 1,
                          {{"kind", std::string(to_string(a.kind))},
                           {"severity", std::string(to_string(a.severity))}});
  }
  return out;
}

} // namespace sonar
