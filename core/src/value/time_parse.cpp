#include "condkit/coerce.h"

#include <cctype>
#include <cstdint>
#include <cstdio>

namespace condkit {

namespace {

struct CivilTime {
  int64_t year = 0;
  int month = 1;
  int day = 1;
  int hour = 0;
  int minute = 0;
  int second = 0;
  int64_t nanos = 0;
  int offset_seconds = 0;
};

/// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t days_from_civil(int64_t y, int m, int d) {
  y -= m <= 2 ? 1 : 0;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const int64_t yoe = y - era * 400;
  const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

void civil_from_days(int64_t z, int64_t& y, int& m, int& d) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const int64_t doe = z - era * 146097;
  const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const int64_t mp = (5 * doy + 2) / 153;
  d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  y = yoe + era * 400 + (m <= 2 ? 1 : 0);
}

bool is_leap(int64_t y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int64_t y, int m) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m == 2 && is_leap(y)) return 29;
  return kDays[m - 1];
}

/// Cursor over the input with fixed-width field readers.
/// Every reader returns false without consuming on mismatch.
class Scanner {
 public:
  explicit Scanner(const std::string& text) : text_(text) {}

  bool digits(size_t count, int& out) {
    if (pos_ + count > text_.size()) return false;
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
      char c = text_[pos_ + i];
      if (!std::isdigit(static_cast<unsigned char>(c))) return false;
      value = value * 10 + (c - '0');
    }
    pos_ += count;
    out = value;
    return true;
  }

  bool literal(char c) {
    if (pos_ >= text_.size() || text_[pos_] != c) return false;
    ++pos_;
    return true;
  }

  bool peek(char c) const { return pos_ < text_.size() && text_[pos_] == c; }

  /// Optional `.ddddddddd` fraction; more than nine digits are truncated.
  bool fraction(int64_t& nanos) {
    nanos = 0;
    if (!peek('.') && !peek(',')) return true;
    ++pos_;
    size_t start = pos_;
    int64_t scale = 100000000;
    while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
      if (scale > 0) {
        nanos += (text_[pos_] - '0') * scale;
        scale /= 10;
      }
      ++pos_;
    }
    return pos_ > start;
  }

  bool done() const { return pos_ == text_.size(); }

 private:
  const std::string& text_;
  size_t pos_ = 0;
};

/// Reads a YYYY-MM-DD date.
/// MUST reject out-of-range months and days, leap years included.
/// Inputs are the scanner; outputs fill year, month and day.
bool read_date(Scanner& in, CivilTime& out) {
  int year = 0;
  if (!in.digits(4, year) || !in.literal('-') || !in.digits(2, out.month) || !in.literal('-') ||
      !in.digits(2, out.day)) {
    return false;
  }
  out.year = year;
  if (out.month < 1 || out.month > 12) return false;
  return out.day >= 1 && out.day <= days_in_month(out.year, out.month);
}

/// Reads HH:MM:SS with an optional fraction.
/// MUST reject hours over 23 and minutes or seconds over 59.
/// Inputs are the scanner; outputs fill the clock fields.
bool read_clock(Scanner& in, CivilTime& out) {
  if (!in.digits(2, out.hour) || !in.literal(':') || !in.digits(2, out.minute) ||
      !in.literal(':') || !in.digits(2, out.second)) {
    return false;
  }
  if (out.hour > 23 || out.minute > 59 || out.second > 59) return false;
  return in.fraction(out.nanos);
}

/// Reads a Z or +hh:mm / -hh:mm zone designator.
/// MUST record the offset in seconds east of UTC.
/// Inputs are the scanner; outputs fill offset_seconds.
bool read_zone(Scanner& in, CivilTime& out) {
  if (in.literal('Z')) return true;
  int sign = 0;
  if (in.literal('+')) {
    sign = 1;
  } else if (in.literal('-')) {
    sign = -1;
  } else {
    return false;
  }
  int hours = 0;
  int minutes = 0;
  if (!in.digits(2, hours) || !in.literal(':') || !in.digits(2, minutes)) return false;
  if (hours > 23 || minutes > 59) return false;
  out.offset_seconds = sign * (hours * 3600 + minutes * 60);
  return true;
}

// Whole seconds a nanosecond Timestamp can hold, roughly years 1678 to 2262.
constexpr int64_t kMaxSeconds = INT64_MAX / 1000000000 - 1;

/// Converts civil fields to a UTC Timestamp.
/// MUST return nullopt outside the nanosecond Timestamp range.
/// Inputs are validated civil fields; no side effects.
std::optional<Timestamp> to_timestamp(const CivilTime& t) {
  int64_t days = days_from_civil(t.year, t.month, t.day);
  int64_t secs = days * 86400 + t.hour * 3600 + t.minute * 60 + t.second - t.offset_seconds;
  if (secs > kMaxSeconds || secs < -kMaxSeconds) return std::nullopt;
  return Timestamp(std::chrono::seconds(secs)) + std::chrono::nanoseconds(t.nanos);
}

// Layouts in match order. RFC 3339 covers both the plain and the
// sub-second form since the fraction is optional.
bool parse_rfc3339(const std::string& text, CivilTime& out) {
  Scanner in(text);
  return read_date(in, out) && in.literal('T') && read_clock(in, out) && read_zone(in, out) &&
         in.done();
}

bool parse_date_time(const std::string& text, CivilTime& out) {
  Scanner in(text);
  return read_date(in, out) && in.literal(' ') && read_clock(in, out) && in.done();
}

bool parse_date_only(const std::string& text, CivilTime& out) {
  Scanner in(text);
  return read_date(in, out) && in.done();
}

bool parse_clock_only(const std::string& text, CivilTime& out) {
  Scanner in(text);
  out.year = 1970;
  out.month = 1;
  out.day = 1;
  return read_clock(in, out) && in.done();
}

}  // namespace

/// Tries every supported layout in order and takes the first match.
/// MUST NOT fall through to later layouts once one matches.
/// Inputs are raw strings; outputs are nullopt when no layout matches.
std::optional<Timestamp> parse_time(const std::string& text) {
  using Layout = bool (*)(const std::string&, CivilTime&);
  static const Layout kLayouts[] = {parse_rfc3339, parse_date_time, parse_date_only,
                                    parse_clock_only};
  for (Layout layout : kLayouts) {
    CivilTime t;
    if (layout(text, t)) return to_timestamp(t);
  }
  return std::nullopt;
}

/// Formats an instant as RFC 3339 in UTC.
/// MUST trim trailing zeros from the fraction and omit it when zero.
/// Inputs are instants; outputs are strings with no side effects.
std::string format_time(Timestamp t) {
  auto since_epoch = t.time_since_epoch();
  auto secs = std::chrono::floor<std::chrono::seconds>(since_epoch);
  int64_t nanos = (since_epoch - secs).count();
  int64_t total = secs.count();
  int64_t days = total >= 0 ? total / 86400 : -((-total + 86399) / 86400);
  int64_t rem = total - days * 86400;

  int64_t year = 0;
  int month = 0;
  int day = 0;
  civil_from_days(days, year, month, day);

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04lld-%02d-%02dT%02d:%02d:%02d", static_cast<long long>(year),
                month, day, static_cast<int>(rem / 3600), static_cast<int>(rem % 3600 / 60),
                static_cast<int>(rem % 60));
  std::string out = buf;
  if (nanos != 0) {
    std::snprintf(buf, sizeof(buf), ".%09lld", static_cast<long long>(nanos));
    std::string frac = buf;
    while (frac.back() == '0') frac.pop_back();
    out += frac;
  }
  out += 'Z';
  return out;
}

}  // namespace condkit
