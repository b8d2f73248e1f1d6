#include "sonar/Util.h"
#include <cstddef>
#include <cstdint>
#include <string_view>

using namespace sonar;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  std::string_view s(reinterpret_cast<const char*>(data), size);
  auto t = parse_iso8601(s);
  if (t && utc_year(*t) <= 9999) {
    // Whole-second timestamps must survive a format/parse round trip.
    TimeMs whole = *t - (*t % 1000);
    auto back = parse_iso8601(format_iso8601(whole));
    if (!back || *back != whole) __builtin_trap();
  }
  return 0;
}
