#include "sonar/TermWeighting.h"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <mutex>
#include <unordered_set>
#include <spdlog/spdlog.h>
#include "sonar/Util.h"

namespace sonar {

namespace {

struct Range {
  char32_t lo;
  char32_t hi;
};

// Non-ASCII punctuation, symbols, spaces and controls. Sorted, disjoint.
constexpr Range kSeparators[] = {
    {0x0080, 0x00A9}, {0x00AB, 0x00B1}, {0x00B4, 0x00B4}, {0x00B6, 0x00B8},
    {0x00BB, 0x00BB}, {0x00BF, 0x00BF}, {0x00D7, 0x00D7}, {0x00F7, 0x00F7},
    {0x02C2, 0x02C5}, {0x02D2, 0x02DF}, {0x037E, 0x037E}, {0x0387, 0x0387},
    {0x055A, 0x055F}, {0x0589, 0x058A}, {0x05BE, 0x05BE}, {0x05C0, 0x05C0},
    {0x05C3, 0x05C3}, {0x05F3, 0x05F4}, {0x060C, 0x060D}, {0x061B, 0x061F},
    {0x066A, 0x066D}, {0x06D4, 0x06D4}, {0x0964, 0x0965}, {0x0E4F, 0x0E4F},
    {0x0E5A, 0x0E5B}, {0x1680, 0x1680}, {0x2000, 0x206F}, {0x20A0, 0x20CF},
    {0x2190, 0x245F}, {0x2500, 0x2775}, {0x2794, 0x2BFF}, {0x2E00, 0x2E7F},
    {0x3000, 0x3004}, {0x3008, 0x3020}, {0x3030, 0x3030}, {0x303D, 0x303F},
    {0xFD3E, 0xFD3F}, {0xFE10, 0xFE19}, {0xFE30, 0xFE6F}, {0xFEFF, 0xFEFF},
    {0xFF01, 0xFF0F}, {0xFF1A, 0xFF20}, {0xFF3B, 0xFF40}, {0xFF5B, 0xFF65},
    {0xFFE0, 0xFFEE}, {0xFFF0, 0xFFFF}, {0x1F000, 0x1FAFF},
};

bool is_word_codepoint(char32_t cp) {
  if (cp < 0x80) {
    return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z') || (cp >= '0' && cp <= '9') ||
           cp == '_';
  }
  auto it = std::upper_bound(std::begin(kSeparators), std::end(kSeparators), cp,
                             [](char32_t v, const Range& r) { return v < r.lo; });
  if (it == std::begin(kSeparators)) return true;
  --it;
  return cp > it->hi;
}

} // namespace

double FrequencyTable::inverse_document_frequency(const std::string& term) const {
  auto it = idf.find(term);
  return it == idf.end() ? 0.0 : it->second;
}

std::vector<std::string> tokenize(std::string_view text) {
  std::vector<std::string> out;
  std::string cur;
  size_t pos = 0;
  while (pos < text.size()) {
    const char32_t cp = next_codepoint(text, pos);
    if (is_word_codepoint(cp)) {
      append_utf8(cur, fold_case(cp));
    } else if (!cur.empty()) {
      out.push_back(std::move(cur));
      cur.clear();
    }
  }
  if (!cur.empty()) out.push_back(std::move(cur));
  return out;
}

TermWeights term_frequency(const std::vector<std::string>& tokens) {
  TermWeights tf;
  if (tokens.empty()) return tf;
  const double total = static_cast<double>(tokens.size());
  std::unordered_map<std::string, uint32_t> counts;
  for (const auto& t : tokens) counts[t]++;
  tf.reserve(counts.size());
  for (const auto& kv : counts) tf.emplace(kv.first, static_cast<double>(kv.second) / total);
  return tf;
}

TermVector vectorize(std::string_view text, const FrequencyTable& table) {
  TermVector v{};
  v.tokens = tokenize(text);
  TermWeights tf = term_frequency(v.tokens);
  double norm_sq = 0.0;
  v.weights.reserve(tf.size());
  for (const auto& kv : tf) {
    double w = kv.second * table.inverse_document_frequency(kv.first);
    v.weights.emplace(kv.first, w);
    norm_sq += w * w;
  }
  v.norm = std::sqrt(norm_sq);
  v.generation = table.generation;
  return v;
}

TermWeighting::TermWeighting() : table_(std::make_shared<FrequencyTable>()) {}

void TermWeighting::train(const std::vector<std::string>& documents) {
  auto next = std::make_shared<FrequencyTable>();
  next->doc_count = static_cast<uint32_t>(documents.size());
  for (const auto& doc : documents) {
    auto tokens = tokenize(doc);
    std::unordered_set<std::string> unique(tokens.begin(), tokens.end());
    for (const auto& term : unique) next->doc_freq[term]++;
  }
  next->idf.reserve(next->doc_freq.size());
  for (const auto& kv : next->doc_freq) {
    // df >= 1 here, so doc_count >= 1 as well.
    next->idf.emplace(kv.first, std::log(static_cast<double>(next->doc_count) /
                                         static_cast<double>(kv.second)));
  }

  std::unique_lock<std::shared_mutex> lock(mu_);
  next->generation = table_->generation + 1;
  table_ = std::move(next);
  spdlog::info("term_weighting: trained on {} documents, {} distinct terms (generation {})",
               table_->doc_count, table_->doc_freq.size(), table_->generation);
}

TablePtr TermWeighting::snapshot() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return table_;
}

uint64_t TermWeighting::generation() const {
  return snapshot()->generation;
}

double TermWeighting::inverse_document_frequency(const std::string& term) const {
  return snapshot()->inverse_document_frequency(term);
}

TermVector TermWeighting::vectorize(std::string_view text) const {
  auto table = snapshot();
  return sonar::vectorize(text, *table);
}

} // namespace sonar
