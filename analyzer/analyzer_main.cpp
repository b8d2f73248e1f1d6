#include "sonar/Analyzer.h"
#include "sonar/SampleCorpus.h"
#include <cstdlib>
#include <iostream>
#include <string>
#include <fmt/format.h>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

using namespace sonar;

// Reads one policy text per line from stdin and prints its analogs and risk verdict.
// Usage: sonar_analyzer [threshold]
int main(int argc, char** argv) {
  spdlog::cfg::load_env_levels();

  AnalyzerConfig cfg{};
  if (argc > 1) {
    char* end = nullptr;
    double t = std::strtod(argv[1], &end);
    if (end == argv[1] || *end != '\0' || t < 0.0 || t > 1.0) {
      spdlog::error("analyzer: threshold must be a number in [0,1], got '{}'", argv[1]);
      return 2;
    }
    cfg.search.threshold = t;
  }

  PolicyAnalyzer analyzer(cfg);
  analyzer.train(sample_corpus());

  std::string line;
  while (std::getline(std::cin, line)) {
    auto res = analyzer.analyze(line);
    if (res.status != Status::Ok) {
      std::cout << "error: " << to_string(res.status) << "\n";
      continue;
    }
    for (const auto& m : res.matches) {
      std::cout << fmt::format("match id={} year={} type={} score={:.4f}\n", m.record.id,
                               m.record.year, m.record.policy_type, m.score);
    }
    const auto& a = res.assessment;
    std::cout << fmt::format("risk level={} score={:.3f} confidence={:.3f} factors={}\n",
                             to_string(a.level), a.score, a.confidence, a.factors.size());
    for (const auto& r : a.recommendations) std::cout << "  - " << r << "\n";
    std::cout.flush();
  }
  return 0;
}
