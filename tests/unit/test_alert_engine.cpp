#include "sonar/AlertEngine.h"
#include "sonar/Util.h"
#include <cassert>
#include <cmath>

using namespace sonar;

namespace {
bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) < eps; }

TimeMs at(const char* iso) {
  auto t = parse_iso8601(iso);
  assert(t.has_value());
  return *t;
}
}

void test_alert_severity_bands() {
  AlertConfig cfg{};
  AlertThresholdEngine e(cfg);

  // Inflation crosses alert (0.02) but not critical (0.03).
  auto s = e.resolve_severity(AlertKind::Inflation, 0.025, false);
  assert(s && *s == AlertSeverity::High);
  assert(*e.resolve_severity(AlertKind::Inflation, 0.031, false) == AlertSeverity::Critical);
  assert(*e.resolve_severity(AlertKind::Inflation, 0.015, false) == AlertSeverity::Medium);
  assert(!e.resolve_severity(AlertKind::Inflation, 0.005, false));
  assert(!e.resolve_severity(AlertKind::Inflation, -0.05, false));

  // Crossing both alert and critical is Critical, never High.
  assert(*e.resolve_severity(AlertKind::Sentiment, -0.5, false) == AlertSeverity::Critical);
  assert(*e.resolve_severity(AlertKind::Sentiment, -0.3, false) == AlertSeverity::High);
  assert(*e.resolve_severity(AlertKind::Sentiment, -0.15, false) == AlertSeverity::Medium);
  assert(!e.resolve_severity(AlertKind::Sentiment, -0.1, false));
  assert(!e.resolve_severity(AlertKind::Sentiment, 0.3, false));

  assert(*e.resolve_severity(AlertKind::Gdp, -0.004, false) == AlertSeverity::Medium);

  // positive_is_good negates the value before comparing.
  assert(*e.resolve_severity(AlertKind::Gdp, 0.02, true) == AlertSeverity::Critical);
  assert(!e.resolve_severity(AlertKind::Gdp, -0.02, true));

  // Employment and trade carry no limits until enabled.
  assert(e.bands_for(AlertKind::Trade) == nullptr);
  assert(e.bands_for(AlertKind::Employment) == nullptr);
  assert(!e.resolve_severity(AlertKind::Trade, -1.0, false));
  assert(!e.evaluate(7, AlertKind::Trade, "trade_balance_change", -1.0, false, 0));

  AlertConfig on{};
  on.trade.enabled = true;
  AlertThresholdEngine e2(on);
  assert(e2.bands_for(AlertKind::Trade) != nullptr);
  assert(*e2.resolve_severity(AlertKind::Trade, -0.06, false) == AlertSeverity::High);
  auto t = e2.evaluate(7, AlertKind::Trade, "trade_balance_change", -0.06, false, 0);
  assert(t && t->message == "trade changed by -6.0% (threshold: -2.0%)");
}

void test_alert_fields() {
  AlertConfig cfg{};
  AlertThresholdEngine e(cfg);
  const TimeMs now = at("2024-05-01T12:00:00Z");

  auto a = e.evaluate(42, AlertKind::Inflation, "inflation_rate", 0.025, false, now);
  assert(a.has_value());
  assert(a->id == "ALERT-20240501120000-inflation");
  assert(a->policy_id == 42);
  assert(a->kind == AlertKind::Inflation);
  assert(a->metric == "inflation_rate");
  assert(a->current_value == 0.025);
  assert(a->threshold == 0.01);
  assert(a->severity == AlertSeverity::High);
  assert(a->message == "Inflation impact detected: 2.5% (threshold: 1.0%)");
  assert((a->related_indicators == std::vector<std::string>{"cpi", "ppi", "wages"}));
  assert(a->timestamp == "2024-05-01T12:00:00Z");

  assert(e.message_for(AlertKind::Sentiment, -0.2, -0.15) ==
         "Policy sentiment changed by -20.0% (threshold: -15.0%)");
  assert(e.message_for(AlertKind::Gdp, -0.012, -0.003) ==
         "gdp changed by -1.2% (threshold: -0.3%)");
  assert(related_indicators(AlertKind::Sentiment).size() == 2);
}

void test_sentiment_aggregation() {
  AlertConfig cfg{};
  AlertThresholdEngine e(cfg);
  const TimeMs now = at("2024-05-31T00:00:00Z");

  // A lone 40-day-old source carries no weight: no mean, no alert.
  std::vector<NewsSource> stale = {{"2024-04-21", 0.0}};
  auto agg = e.aggregate_sentiment(stale, now);
  assert(agg.status == FeedStatus::Ok);
  assert(!agg.mean.has_value());
  assert(agg.used_sources == 0);
  auto none = e.check_sentiment(1, stale, now);
  assert(none.status == FeedStatus::Ok);
  assert(none.alerts.empty());

  // Weights 1.0 and 0.5; the 30-day-old source is excluded.
  std::vector<NewsSource> sources = {
      {"2024-05-31T00:00:00Z", 0.1},
      {"2024-05-16", 0.7},
      {"2024-05-01", 0.9},
  };
  agg = e.aggregate_sentiment(sources, now);
  assert(agg.used_sources == 2);
  assert(near(*agg.mean, 0.3));
  auto res = e.check_sentiment(9, sources, now);
  assert(res.alerts.size() == 1);
  assert(res.alerts[0].kind == AlertKind::Sentiment);
  assert(res.alerts[0].metric == "sentiment_change");
  assert(near(res.alerts[0].current_value, -0.2));
  assert(res.alerts[0].severity == AlertSeverity::Medium);

  // Future-dated sources count as fresh.
  std::vector<NewsSource> future = {{"2024-06-10", 0.0}};
  agg = e.aggregate_sentiment(future, now);
  assert(agg.mean && *agg.mean == 0.0);

  std::vector<NewsSource> bad = {{"2024-05-30", 0.2}, {"yesterday", 0.1}};
  auto malformed = e.check_sentiment(1, bad, now);
  assert(malformed.status == FeedStatus::Malformed);
  assert(malformed.alerts.empty());

  assert(e.check_sentiment(1, {}, now).alerts.empty());
}

void test_indicator_checks() {
  AlertConfig cfg{};
  cfg.employment.enabled = true;
  AlertThresholdEngine e(cfg);
  IndicatorSnapshot snap{};
  snap.changes[AlertKind::Employment] = -0.03;
  snap.changes[AlertKind::Gdp] = 0.001;
  snap.changes[AlertKind::Inflation] = 0.025;

  auto res = e.check_indicators(3, snap, at("2024-01-15"));
  assert(res.status == FeedStatus::Ok);
  assert(res.alerts.size() == 2);
  assert(res.alerts[0].kind == AlertKind::Inflation);
  assert(res.alerts[0].severity == AlertSeverity::High);
  assert(res.alerts[1].kind == AlertKind::Employment);
  assert(res.alerts[1].severity == AlertSeverity::Critical);
  assert(res.alerts[1].metric == "employment_change");
  assert(res.alerts[1].message == "employment changed by -3.0% (threshold: -0.5%)");

  // With the default configuration the same snapshot only raises the inflation alert.
  AlertThresholdEngine defaults(AlertConfig{});
  auto quiet_kinds = defaults.check_indicators(3, snap, at("2024-01-15"));
  assert(quiet_kinds.alerts.size() == 1);
  assert(quiet_kinds.alerts[0].kind == AlertKind::Inflation);

  IndicatorSnapshot gdp{};
  gdp.changes[AlertKind::Gdp] = -0.012;
  auto g = e.check_indicators(3, gdp, at("2024-01-15"));
  assert(g.alerts.size() == 1);
  assert(g.alerts[0].metric == "gdp_change");
  assert(g.alerts[0].message == "gdp changed by -1.2% (threshold: -0.3%)");

  IndicatorSnapshot quiet{};
  quiet.changes[AlertKind::Gdp] = 0.004;
  assert(e.check_indicators(3, quiet, 0).alerts.empty());
}
