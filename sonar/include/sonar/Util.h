#pragma once
#include <optional>
#include <string>
#include <string_view>
#include "Common.h"

namespace sonar {

inline constexpr TimeMs kMsPerDay = 86400000ull;

std::string to_lower(std::string_view s);
bool is_blank(std::string_view s);

// Case-insensitive substring test; `needle` must already be lowercase.
bool contains_lower(std::string_view haystack_lower, std::string_view needle);

inline constexpr char32_t kReplacementChar = 0xFFFD;

// Decodes the UTF-8 sequence at `pos` and advances past it. Truncated,
// overlong or surrogate sequences yield U+FFFD and consume one byte.
char32_t next_codepoint(std::string_view s, size_t& pos);
void append_utf8(std::string& out, char32_t cp);

// One-to-one lowercase mapping for ASCII, Latin-1, Latin Extended-A,
// Latin Extended Additional, Greek, Cyrillic, Armenian and fullwidth Latin.
// Anything else comes back unchanged.
char32_t fold_case(char32_t cp);

// Accepts YYYY-MM-DD, YYYY-MM-DDTHH:MM[:SS[.fff]] with optional Z or +HH:MM offset.
std::optional<TimeMs> parse_iso8601(std::string_view s);

std::string format_iso8601(TimeMs t);       // 2024-05-01T12:30:00Z
std::string format_compact_utc(TimeMs t);   // 20240501123000

TimeMs now_ms();

// Gregorian calendar year (UTC) of `t`.
int utc_year(TimeMs t);

} // namespace sonar
