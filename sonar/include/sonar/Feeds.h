#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "AlertEngine.h"
#include "Common.h"

namespace sonar {

// Collaborators that reach external analysis services. Implementations
// enforce timeout_ms themselves and report Timeout/Cancelled rather than block.

struct NewsResult {
  FeedStatus status{FeedStatus::Ok};
  std::vector<NewsSource> sources;
};

struct IndicatorResult {
  FeedStatus status{FeedStatus::Ok};
  IndicatorSnapshot snapshot{};
};

struct AcademicSource {
  std::string id;
  std::string title;
  std::string journal;
  int year{0};
  std::optional<double> sentiment{};
  std::string url;
};

struct AcademicResult {
  FeedStatus status{FeedStatus::Ok};
  std::vector<AcademicSource> sources;
};

class INewsAnalysis {
 public:
  virtual ~INewsAnalysis() = default;
  virtual NewsResult analyze_news(const std::string& policy_text, uint32_t timeout_ms) = 0;
};

class IIndicatorFeed {
 public:
  virtual ~IIndicatorFeed() = default;
  virtual IndicatorResult get_indicators(const std::string& policy_type,
                                         const std::string& timeframe, uint32_t timeout_ms) = 0;
};

class IAcademicAnalysis {
 public:
  virtual ~IAcademicAnalysis() = default;
  virtual AcademicResult analyze_academic(const std::string& policy_text, uint32_t timeout_ms) = 0;
};

} // namespace sonar
