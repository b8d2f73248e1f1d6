#pragma once
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sonar {

using TermWeights = std::unordered_map<std::string, double>;

struct TermVector {
  std::vector<std::string> tokens;
  TermWeights weights;
  double norm{0.0};
  uint64_t generation{0}; // table the weights were computed against
};

// Document frequencies of one training pass. Immutable once published.
struct FrequencyTable {
  std::unordered_map<std::string, uint32_t> doc_freq;
  std::unordered_map<std::string, double> idf;
  uint32_t doc_count{0};
  uint64_t generation{0};

  double inverse_document_frequency(const std::string& term) const;
};

using TablePtr = std::shared_ptr<const FrequencyTable>;

std::vector<std::string> tokenize(std::string_view text);
TermWeights term_frequency(const std::vector<std::string>& tokens);
TermVector vectorize(std::string_view text, const FrequencyTable& table);

class TermWeighting {
 public:
  TermWeighting();

  // Rebuilds the table from scratch and publishes it in one step.
  void train(const std::vector<std::string>& documents);

  TablePtr snapshot() const;
  uint64_t generation() const;

  double inverse_document_frequency(const std::string& term) const;
  TermVector vectorize(std::string_view text) const;

 private:
  mutable std::shared_mutex mu_;
  TablePtr table_;
};

} // namespace sonar
