#include "sonar/Util.h"
#include <chrono>
#include <cctype>
#include <fmt/format.h>

namespace sonar {

namespace {

int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const int64_t yoe = y - era * 400;
  const int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

struct CivilDate {
  int64_t year{1970};
  unsigned month{1};
  unsigned day{1};
};

CivilDate civil_from_days(int64_t z) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const int64_t doe = z - era * 146097;
  const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const int64_t mp = (5 * doy + 2) / 153;
  CivilDate out{};
  out.day = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
  out.month = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
  out.year = yoe + era * 400 + (out.month <= 2 ? 1 : 0);
  return out;
}

bool is_leap(int64_t y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(int64_t y, unsigned m) {
  static const unsigned kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m == 2 && is_leap(y)) return 29;
  return kDays[m - 1];
}

class Cursor {
 public:
  explicit Cursor(std::string_view s) : s_(s) {}

  bool digits(size_t n, int& out) {
    if (pos_ + n > s_.size()) return false;
    int v = 0;
    for (size_t i = 0; i < n; ++i) {
      char c = s_[pos_ + i];
      if (c < '0' || c > '9') return false;
      v = v * 10 + (c - '0');
    }
    pos_ += n;
    out = v;
    return true;
  }
  bool accept(char c) {
    if (pos_ < s_.size() && s_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }
  bool peek_digit() const {
    return pos_ < s_.size() && s_[pos_] >= '0' && s_[pos_] <= '9';
  }
  bool done() const { return pos_ == s_.size(); }

 private:
  std::string_view s_;
  size_t pos_{0};
};

struct CivilTime {
  CivilDate date{};
  int64_t hour{0};
  int64_t minute{0};
  int64_t second{0};
};

CivilTime split_time(TimeMs t) {
  const int64_t secs = static_cast<int64_t>(t / 1000);
  CivilTime out{};
  out.date = civil_from_days(secs / 86400);
  const int64_t rem = secs % 86400;
  out.hour = rem / 3600;
  out.minute = (rem % 3600) / 60;
  out.second = rem % 60;
  return out;
}

} // namespace

std::string_view to_string(Status s) {
  switch (s) {
    case Status::Ok: return "ok";
    case Status::InvalidInput: return "invalid_input";
  }
  return "unknown";
}

std::string_view to_string(FeedStatus s) {
  switch (s) {
    case FeedStatus::Ok: return "ok";
    case FeedStatus::Failed: return "failed";
    case FeedStatus::Timeout: return "timeout";
    case FeedStatus::Cancelled: return "cancelled";
    case FeedStatus::Malformed: return "malformed";
  }
  return "unknown";
}

std::string_view to_string(RiskLevel level) {
  switch (level) {
    case RiskLevel::Insufficient: return "Insufficient Data";
    case RiskLevel::Low: return "Low";
    case RiskLevel::LowMedium: return "Low-Medium";
    case RiskLevel::Medium: return "Medium";
    case RiskLevel::High: return "High";
  }
  return "unknown";
}

std::string_view to_string(AlertKind kind) {
  switch (kind) {
    case AlertKind::Sentiment: return "sentiment";
    case AlertKind::Inflation: return "inflation";
    case AlertKind::Gdp: return "gdp";
    case AlertKind::Employment: return "employment";
    case AlertKind::Trade: return "trade";
  }
  return "unknown";
}

std::string_view to_string(AlertSeverity severity) {
  switch (severity) {
    case AlertSeverity::Info: return "info";
    case AlertSeverity::Low: return "low";
    case AlertSeverity::Medium: return "medium";
    case AlertSeverity::High: return "high";
    case AlertSeverity::Critical: return "critical";
  }
  return "unknown";
}

std::string to_lower(std::string_view s) {
  std::string out(s);
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

bool is_blank(std::string_view s) {
  for (char c : s) {
    if (!std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

bool contains_lower(std::string_view haystack_lower, std::string_view needle) {
  return haystack_lower.find(needle) != std::string_view::npos;
}

char32_t next_codepoint(std::string_view s, size_t& pos) {
  const unsigned char lead = static_cast<unsigned char>(s[pos]);
  if (lead < 0x80) {
    ++pos;
    return lead;
  }
  size_t len = 0;
  char32_t cp = 0;
  char32_t min = 0;
  if ((lead & 0xE0) == 0xC0) {
    len = 2;
    cp = lead & 0x1F;
    min = 0x80;
  } else if ((lead & 0xF0) == 0xE0) {
    len = 3;
    cp = lead & 0x0F;
    min = 0x800;
  } else if ((lead & 0xF8) == 0xF0) {
    len = 4;
    cp = lead & 0x07;
    min = 0x10000;
  } else {
    ++pos;
    return kReplacementChar;
  }
  if (pos + len > s.size()) {
    ++pos;
    return kReplacementChar;
  }
  for (size_t i = 1; i < len; ++i) {
    const unsigned char c = static_cast<unsigned char>(s[pos + i]);
    if ((c & 0xC0) != 0x80) {
      ++pos;
      return kReplacementChar;
    }
    cp = (cp << 6) | (c & 0x3F);
  }
  if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    ++pos;
    return kReplacementChar;
  }
  pos += len;
  return cp;
}

void append_utf8(std::string& out, char32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

char32_t fold_case(char32_t cp) {
  if (cp >= 'A' && cp <= 'Z') return cp + 0x20;
  if (cp < 0xC0) return cp;
  if (cp <= 0xDE) return cp == 0xD7 ? cp : cp + 0x20;
  // Latin Extended-A pairs upper/lower on alternating code points.
  if ((cp >= 0x0100 && cp <= 0x012F) || (cp >= 0x0132 && cp <= 0x0137) ||
      (cp >= 0x014A && cp <= 0x0177)) {
    return (cp % 2 == 0) ? cp + 1 : cp;
  }
  if ((cp >= 0x0139 && cp <= 0x0148) || (cp >= 0x0179 && cp <= 0x017E)) {
    return (cp % 2 == 1) ? cp + 1 : cp;
  }
  if (cp == 0x0178) return 0xFF;
  if (cp == 0x0386) return 0x03AC;
  if (cp >= 0x0388 && cp <= 0x038A) return cp + 0x25;
  if (cp == 0x038C) return 0x03CC;
  if (cp == 0x038E || cp == 0x038F) return cp + 0x3F;
  if (cp >= 0x0391 && cp <= 0x03AB && cp != 0x03A2) return cp + 0x20;
  if (cp >= 0x0400 && cp <= 0x040F) return cp + 0x50;
  if (cp >= 0x0410 && cp <= 0x042F) return cp + 0x20;
  if ((cp >= 0x0460 && cp <= 0x0481) || (cp >= 0x048A && cp <= 0x04BF) ||
      (cp >= 0x04D0 && cp <= 0x052F)) {
    return (cp % 2 == 0) ? cp + 1 : cp;
  }
  if (cp >= 0x0531 && cp <= 0x0556) return cp + 0x30;
  if ((cp >= 0x1E00 && cp <= 0x1E95) || (cp >= 0x1EA0 && cp <= 0x1EFF)) {
    return (cp % 2 == 0) ? cp + 1 : cp;
  }
  if (cp >= 0xFF21 && cp <= 0xFF3A) return cp + 0x20;
  return cp;
}

std::optional<TimeMs> parse_iso8601(std::string_view s) {
  Cursor cur(s);
  int year = 0, month = 0, day = 0;
  if (!cur.digits(4, year) || !cur.accept('-') || !cur.digits(2, month) ||
      !cur.accept('-') || !cur.digits(2, day)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12) return std::nullopt;
  if (day < 1 || static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month))) {
    return std::nullopt;
  }

  int hour = 0, minute = 0, second = 0, millis = 0;
  int64_t offset_min = 0;
  if (!cur.done()) {
    if (!cur.accept('T') && !cur.accept(' ')) return std::nullopt;
    if (!cur.digits(2, hour) || !cur.accept(':') || !cur.digits(2, minute)) return std::nullopt;
    if (cur.accept(':')) {
      if (!cur.digits(2, second)) return std::nullopt;
      if (cur.accept('.')) {
        if (!cur.peek_digit()) return std::nullopt;
        int scale = 100;
        while (cur.peek_digit()) {
          int digit = 0;
          if (!cur.digits(1, digit)) return std::nullopt;
          millis += digit * scale;
          scale /= 10;
        }
      }
    }
    if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

    if (cur.accept('Z')) {
      // UTC
    } else if (!cur.done()) {
      int sign = 0;
      if (cur.accept('+')) sign = 1;
      else if (cur.accept('-')) sign = -1;
      else return std::nullopt;
      int oh = 0, om = 0;
      if (!cur.digits(2, oh)) return std::nullopt;
      cur.accept(':');
      if (!cur.digits(2, om)) return std::nullopt;
      if (oh > 23 || om > 59) return std::nullopt;
      offset_min = sign * (oh * 60 + om);
    }
  }
  if (!cur.done()) return std::nullopt;

  const int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  const int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offset_min * 60;
  if (secs < 0) return std::nullopt;
  return static_cast<TimeMs>(secs) * 1000 + static_cast<TimeMs>(millis);
}

std::string format_iso8601(TimeMs t) {
  const CivilTime ct = split_time(t);
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z", ct.date.year, ct.date.month,
                     ct.date.day, ct.hour, ct.minute, ct.second);
}

std::string format_compact_utc(TimeMs t) {
  const CivilTime ct = split_time(t);
  return fmt::format("{:04}{:02}{:02}{:02}{:02}{:02}", ct.date.year, ct.date.month,
                     ct.date.day, ct.hour, ct.minute, ct.second);
}

TimeMs now_ms() {
  using namespace std::chrono;
  return static_cast<TimeMs>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

int utc_year(TimeMs t) {
  return static_cast<int>(split_time(t).date.year);
}

} // namespace sonar
