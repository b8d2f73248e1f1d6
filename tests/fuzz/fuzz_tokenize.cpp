#include "sonar/SimilaritySearch.h"
#include "sonar/TermWeighting.h"
#include <cstddef>
#include <cstdint>
#include <string_view>

using namespace sonar;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  std::string_view text(reinterpret_cast<const char*>(data), size);
  size_t split = size / 2;
  TermWeighting tw;
  tw.train({std::string(text.substr(0, split)), std::string(text.substr(split)), "policy"});
  auto a = tw.vectorize(text);
  auto b = tw.vectorize(text.substr(split));
  double s = cosine_similarity(a, b);
  if (s < 0.0 || s > 1.0) __builtin_trap();
  return 0;
}
