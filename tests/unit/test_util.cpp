#include "sonar/Util.h"
#include <cassert>

using namespace sonar;

void test_iso8601() {
  assert(parse_iso8601("1970-01-01") == TimeMs{0});
  assert(parse_iso8601("1970-01-02") == kMsPerDay);
  assert(parse_iso8601("1970-01-01T00:00:01.5Z") == TimeMs{1500});
  assert(parse_iso8601("2024-05-01T12:00:00+02:00") == parse_iso8601("2024-05-01T10:00:00Z"));
  assert(parse_iso8601("2024-05-01 10:00") == parse_iso8601("2024-05-01T10:00:00"));
  assert(parse_iso8601("2024-02-29").has_value());

  assert(!parse_iso8601("2023-02-29"));
  assert(!parse_iso8601("2024-13-01"));
  assert(!parse_iso8601("2024-05-01T25:00"));
  assert(!parse_iso8601("2024-05-01T10:00:00Zjunk"));
  assert(!parse_iso8601("1969-12-31"));
  assert(!parse_iso8601(""));
  assert(!parse_iso8601("May 1st"));

  auto t = parse_iso8601("2021-07-04T09:08:07Z");
  assert(t.has_value());
  assert(format_iso8601(*t) == "2021-07-04T09:08:07Z");
  assert(format_compact_utc(*t) == "20210704090807");
  assert(utc_year(*t) == 2021);
}

void test_text_helpers() {
  assert(to_lower("Trade POLICY") == "trade policy");
  assert(is_blank(""));
  assert(is_blank(" \t\r\n"));
  assert(!is_blank(" x "));
  assert(contains_lower("price increase", "increase"));
  assert(!contains_lower("price increase", "decline"));
}
