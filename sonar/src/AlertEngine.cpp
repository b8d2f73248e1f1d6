#include "sonar/AlertEngine.h"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "sonar/Util.h"

namespace sonar {

namespace {
std::string percent(double v) {
  return fmt::format("{:.1f}%", v * 100.0);
}
} // namespace

const char* metric_name(AlertKind kind) {
  switch (kind) {
    case AlertKind::Sentiment: return "sentiment_change";
    case AlertKind::Inflation: return "inflation_rate";
    case AlertKind::Gdp: return "gdp_change";
    case AlertKind::Employment: return "employment_change";
    case AlertKind::Trade: return "trade_balance_change";
  }
  return "unknown";
}

std::vector<std::string> related_indicators(AlertKind kind) {
  switch (kind) {
    case AlertKind::Sentiment: return {"consumer_confidence", "business_sentiment"};
    case AlertKind::Inflation: return {"cpi", "ppi", "wages"};
    case AlertKind::Gdp: return {"industrial_production", "retail_sales"};
    case AlertKind::Employment: return {"unemployment_rate", "labor_force_participation"};
    case AlertKind::Trade: return {"import_volume", "export_volume"};
  }
  return {};
}

AlertThresholdEngine::AlertThresholdEngine(const AlertConfig& cfg) : cfg_(cfg) {}

const ThresholdBands* AlertThresholdEngine::bands_for(AlertKind kind) const {
  const ThresholdBands* b = nullptr;
  switch (kind) {
    case AlertKind::Sentiment: b = &cfg_.sentiment; break;
    case AlertKind::Inflation: b = &cfg_.inflation; break;
    case AlertKind::Gdp: b = &cfg_.gdp; break;
    case AlertKind::Employment: b = &cfg_.employment; break;
    case AlertKind::Trade: b = &cfg_.trade; break;
  }
  return (b && b->enabled) ? b : nullptr;
}

std::optional<AlertSeverity> AlertThresholdEngine::resolve_severity(AlertKind kind, double value,
                                                                    bool positive_is_good) const {
  const ThresholdBands* b = bands_for(kind);
  if (!b) return std::nullopt;

  double test = positive_is_good ? -value : value;
  double critical = b->critical;
  double alert = b->alert;
  double warning = b->warning;
  if (b->direction == BandDirection::Rising) {
    test = -test;
    critical = -critical;
    alert = -alert;
    warning = -warning;
  }

  if (test <= critical) return AlertSeverity::Critical;
  if (test <= alert) return AlertSeverity::High;
  if (test <= warning) return AlertSeverity::Medium;
  return std::nullopt;
}

std::optional<Alert> AlertThresholdEngine::evaluate(PolicyId policy_id, AlertKind kind,
                                                    const std::string& metric, double value,
                                                    bool positive_is_good, TimeMs now) const {
  auto severity = resolve_severity(kind, value, positive_is_good);
  if (!severity) return std::nullopt;

  Alert a{};
  a.id = fmt::format("ALERT-{}-{}", format_compact_utc(now), to_string(kind));
  a.policy_id = policy_id;
  a.kind = kind;
  a.metric = metric;
  a.current_value = value;
  a.threshold = bands_for(kind)->warning;
  a.severity = *severity;
  a.message = message_for(kind, value, a.threshold);
  a.related_indicators = related_indicators(kind);
  a.timestamp = format_iso8601(now);
  return a;
}

SentimentAggregate AlertThresholdEngine::aggregate_sentiment(const std::vector<NewsSource>& sources,
                                                             TimeMs now) const {
  SentimentAggregate out{};
  double total_weight = 0.0;
  double weighted = 0.0;
  for (const auto& s : sources) {
    auto when = parse_iso8601(s.date);
    if (!when || !std::isfinite(s.sentiment)) {
      spdlog::warn("alert_engine: malformed news source (date '{}')", s.date);
      out.status = FeedStatus::Malformed;
      return out;
    }
    const double age_days = now > *when ? static_cast<double>((now - *when) / kMsPerDay) : 0.0;
    const double weight = std::max(0.0, 1.0 - age_days / cfg_.decay_window_days);
    if (weight <= 0.0) continue;
    weighted += s.sentiment * weight;
    total_weight += weight;
    out.used_sources++;
  }
  if (total_weight > 0.0) out.mean = weighted / total_weight;
  return out;
}

CheckResult AlertThresholdEngine::check_sentiment(PolicyId policy_id,
                                                  const std::vector<NewsSource>& sources,
                                                  TimeMs now) const {
  CheckResult res{};
  if (sources.empty()) return res;
  auto agg = aggregate_sentiment(sources, now);
  res.status = agg.status;
  if (agg.status != FeedStatus::Ok || !agg.mean) return res;

  const double deviation = *agg.mean - cfg_.neutral_baseline;
  if (auto a = evaluate(policy_id, AlertKind::Sentiment, metric_name(AlertKind::Sentiment),
                        deviation, false, now)) {
    res.alerts.push_back(std::move(*a));
  }
  return res;
}

CheckResult AlertThresholdEngine::check_indicators(PolicyId policy_id,
                                                   const IndicatorSnapshot& snapshot,
                                                   TimeMs now) const {
  CheckResult res{};
  for (const auto& kv : snapshot.changes) {
    if (kv.first == AlertKind::Sentiment) continue;
    if (!std::isfinite(kv.second)) {
      spdlog::warn("alert_engine: non-finite {} change in indicator feed", to_string(kv.first));
      res.status = FeedStatus::Malformed;
      continue;
    }
    if (auto a = evaluate(policy_id, kv.first, metric_name(kv.first), kv.second, false, now)) {
      res.alerts.push_back(std::move(*a));
    }
  }
  return res;
}

std::string AlertThresholdEngine::message_for(AlertKind kind, double value,
                                              double threshold) const {
  switch (kind) {
    case AlertKind::Sentiment:
      return fmt::format("Policy sentiment changed by {} (threshold: {})", percent(value),
                         percent(threshold));
    case AlertKind::Inflation:
      return fmt::format("Inflation impact detected: {} (threshold: {})", percent(value),
                         percent(threshold));
    default:
      return fmt::format("{} changed by {} (threshold: {})", to_string(kind), percent(value),
                         percent(threshold));
  }
}

} // namespace sonar
