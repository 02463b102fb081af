/*
 * 설명: UTC 타임스탬프 파싱과 월 단위 달력 연산을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/rating_period_test.cpp, tests/unit/roster_test.cpp
 */
#include "matrank/calendar.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace matrank {
namespace {
bool ReadNumber(const std::string& text, std::size_t pos, std::size_t width, int& out) {
  if (pos + width > text.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = pos; i < pos + width; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
    value = value * 10 + (text[i] - '0');
  }
  out = value;
  return true;
}

std::string Trim(const std::string& text) {
  auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
  auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  return begin < end ? std::string(begin, end) : std::string{};
}
}  // namespace

std::optional<Timestamp> ParseTimestamp(const std::string& raw) {
  const std::string text = Trim(raw);
  int year = 0;
  int month = 0;
  int day = 0;
  if (!ReadNumber(text, 0, 4, year) || text.size() < 10 || text[4] != '-' || !ReadNumber(text, 5, 2, month) ||
      text[7] != '-' || !ReadNumber(text, 8, 2, day)) {
    return std::nullopt;
  }

  boost::gregorian::date date;
  try {
    date = boost::gregorian::date(static_cast<unsigned short>(year), static_cast<unsigned short>(month),
                                  static_cast<unsigned short>(day));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }

  if (text.size() == 10) {
    return Timestamp(date);
  }
  if (text[10] != 'T' && text[10] != ' ') {
    return std::nullopt;
  }

  int hour = 0;
  int minute = 0;
  int second = 0;
  if (!ReadNumber(text, 11, 2, hour) || text.size() < 19 || text[13] != ':' || !ReadNumber(text, 14, 2, minute) ||
      text[16] != ':' || !ReadNumber(text, 17, 2, second)) {
    return std::nullopt;
  }
  if (hour > 23 || minute > 59 || second > 59) {
    return std::nullopt;
  }

  std::size_t pos = 19;
  long micros = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    long scale = 100000;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      micros += (text[pos] - '0') * scale;
      scale /= 10;
      ++pos;
    }
  }

  Timestamp ts(date, boost::posix_time::hours(hour) + boost::posix_time::minutes(minute) +
                         boost::posix_time::seconds(second) + boost::posix_time::microseconds(micros));

  if (pos == text.size() || (text[pos] == 'Z' && pos + 1 == text.size())) {
    return ts;
  }
  if ((text[pos] == '+' || text[pos] == '-') && text.size() == pos + 6 && text[pos + 3] == ':') {
    int off_hour = 0;
    int off_minute = 0;
    if (!ReadNumber(text, pos + 1, 2, off_hour) || !ReadNumber(text, pos + 4, 2, off_minute)) {
      return std::nullopt;
    }
    auto offset = boost::posix_time::hours(off_hour) + boost::posix_time::minutes(off_minute);
    // 현지 시각에서 오프셋을 빼야 UTC가 된다.
    return text[pos] == '+' ? ts - offset : ts + offset;
  }
  return std::nullopt;
}

std::string ToIsoString(const Timestamp& ts) {
  std::ostringstream oss;
  const auto date = ts.date();
  const auto tod = ts.time_of_day();
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(date.year()) << '-' << std::setw(2)
      << static_cast<int>(date.month()) << '-' << std::setw(2) << static_cast<int>(date.day()) << 'T' << std::setw(2)
      << tod.hours() << ':' << std::setw(2) << tod.minutes() << ':' << std::setw(2) << tod.seconds() << 'Z';
  return oss.str();
}

Timestamp UtcNow() { return boost::posix_time::second_clock::universal_time(); }

Timestamp AddCalendarMonths(const Timestamp& anchor, int months) {
  const auto date = anchor.date();
  const int zero_based = static_cast<int>(date.month()) - 1 + months;
  const int year = static_cast<int>(date.year()) + (zero_based >= 0 ? zero_based / 12 : (zero_based - 11) / 12);
  const int month = ((zero_based % 12) + 12) % 12 + 1;
  const unsigned short last_day = boost::gregorian::gregorian_calendar::end_of_month_day(
      static_cast<unsigned short>(year), static_cast<unsigned short>(month));
  const unsigned short day = std::min<unsigned short>(date.day(), last_day);
  return Timestamp(boost::gregorian::date(static_cast<unsigned short>(year), static_cast<unsigned short>(month), day),
                   anchor.time_of_day());
}

double MonthsBetween(const Timestamp& first, const Timestamp& second) {
  if (second <= first) {
    return 0.0;
  }
  const double days = static_cast<double>((second - first).total_seconds()) / 86400.0;
  return days / 30.0;
}

int SchoolYear(const Timestamp& ts) {
  const auto date = ts.date();
  const int year = static_cast<int>(date.year());
  return date.month() > 8 ? year : year - 1;
}

}  // namespace matrank
