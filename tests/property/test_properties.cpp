#include "sonar/EmbeddingCache.h"
#include "sonar/SimilaritySearch.h"
#include <cassert>
#include <cmath>
#include <random>
#include <string>
#include <vector>

using namespace sonar;

namespace {
const char* kWords[] = {"tariff", "steel", "credit", "tax", "renewable", "wage", "minimum",
                        "import", "export", "subsidy", "carbon", "quota", "labor", "energy",
                        "price", "growth", "decline", "rural", "urban", "housing"};

std::string random_text(std::mt19937& rng) {
  std::uniform_int_distribution<size_t> len(0, 8);
  std::uniform_int_distribution<size_t> pick(0, sizeof(kWords) / sizeof(kWords[0]) - 1);
  std::string out;
  size_t n = len(rng);
  for (size_t i = 0; i < n; ++i) {
    if (i) out += (i % 3 == 0) ? ", " : " ";
    out += kWords[pick(rng)];
  }
  return out;
}
}

int main() {
  std::mt19937 rng(20240501u);
  for (int round = 0; round < 50; ++round) {
    Corpus corpus;
    std::vector<std::string> texts;
    size_t n = 1 + rng() % 12;
    for (size_t i = 0; i < n; ++i) {
      PolicyRecord r{};
      r.id = i;
      r.text = random_text(rng);
      texts.push_back(r.text);
      corpus.push_back(r);
    }

    EmbeddingConfig cfg{};
    cfg.cache_capacity = 1 + rng() % 8;
    EmbeddingCache cache(cfg);
    cache.train(texts);
    SimilaritySearch search(cache);

    // Batch output matches one-by-one lookups, in input order.
    auto batch = cache.get_batch(texts, 1 + rng() % 4);
    for (size_t i = 0; i < texts.size(); ++i) {
      auto single = cache.get_or_compute(texts[i]);
      assert(single->weights == batch[i]->weights);
      assert(single->norm == batch[i]->norm);
    }

    for (size_t i = 0; i < texts.size(); ++i) {
      auto v = cache.get_or_compute(texts[i]);
      for (const auto& kv : v->weights) assert(kv.second >= 0.0);
      if (v->norm > 0.0) assert(std::fabs(cosine_similarity(*v, *v) - 1.0) < 1e-9);
      else assert(cosine_similarity(*v, *v) == 0.0);
    }

    std::string query = random_text(rng);
    if (query.empty()) query = kWords[0];
    double threshold = static_cast<double>(rng() % 100) / 100.0;
    auto res = search.find_similar(query, corpus, threshold);
    assert(res.status == Status::Ok);
    for (size_t i = 0; i < res.matches.size(); ++i) {
      const auto& m = res.matches[i];
      assert(m.score >= threshold);
      assert(m.score >= 0.0 && m.score <= 1.0);
      if (i > 0) {
        const auto& prev = res.matches[i - 1];
        assert(prev.score >= m.score);
        if (prev.score == m.score) assert(prev.record.id < m.record.id);
      }
    }

    auto qv = cache.get_or_compute(query);
    for (const auto& t : texts) {
      auto tv = cache.get_or_compute(t);
      assert(cosine_similarity(*qv, *tv) == cosine_similarity(*tv, *qv));
    }
  }
  return 0;
}
