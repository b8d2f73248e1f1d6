#pragma once
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace sonar {

using TimeMs = uint64_t; // milliseconds since the Unix epoch, UTC
using PolicyId = uint64_t;

struct PolicyRecord {
  PolicyId id{0};
  std::string text;
  int year{0};
  std::string policy_type;
  std::string jurisdiction;
  std::set<std::string> risk_factors;
  std::string outcome_narrative;
};

using Corpus = std::vector<PolicyRecord>;

enum class Status : uint8_t {
  Ok = 0,
  InvalidInput = 1,
};

// Outcome of a call into an external analysis collaborator.
enum class FeedStatus : uint8_t {
  Ok = 0,
  Failed = 1,
  Timeout = 2,
  Cancelled = 3,
  Malformed = 4,
};

enum class RiskLevel : uint8_t {
  Insufficient = 0,
  Low,
  LowMedium,
  Medium,
  High,
};

enum class AlertKind : uint8_t {
  Sentiment = 0,
  Inflation,
  Gdp,
  Employment,
  Trade,
};

enum class AlertSeverity : uint8_t {
  Info = 0,
  Low,
  Medium,
  High,
  Critical,
};

std::string_view to_string(Status s);
std::string_view to_string(FeedStatus s);
std::string_view to_string(RiskLevel level);
std::string_view to_string(AlertKind kind);
std::string_view to_string(AlertSeverity severity);

} // namespace sonar
