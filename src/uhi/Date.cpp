#include "uhi/Date.hpp"

#include <cctype>
#include <cstdio>
#include <string>

namespace uhi {

namespace {

bool ParseDigits(const std::string& s, std::size_t pos, std::size_t len, int& out)
{
  if (pos + len > s.size()) return false;
  int v = 0;
  for (std::size_t i = pos; i < pos + len; ++i) {
    const unsigned char c = static_cast<unsigned char>(s[i]);
    if (!std::isdigit(c)) return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  return true;
}

bool IsLeapYear(int y)
{
  return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

} // namespace

bool CivilDate::operator<(const CivilDate& o) const
{
  if (year != o.year) return year < o.year;
  if (month != o.month) return month < o.month;
  return day < o.day;
}

int DaysInMonth(int year, int month)
{
  static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) return 0;
  if (month == 2 && IsLeapYear(year)) return 29;
  return kDays[month - 1];
}

bool ParseIsoDate(const std::string& s, CivilDate& out)
{
  CivilDate d{};
  d.month = 1;
  d.day = 1;

  if (!ParseDigits(s, 0, 4, d.year)) return false;
  if (s.size() == 4) {
    out = d;
    return true;
  }

  if (s.size() < 7 || s[4] != '-') return false;
  if (!ParseDigits(s, 5, 2, d.month)) return false;
  if (d.month < 1 || d.month > 12) return false;
  if (s.size() == 7) {
    out = d;
    return true;
  }

  if (s.size() != 10 || s[7] != '-') return false;
  if (!ParseDigits(s, 8, 2, d.day)) return false;
  if (d.day < 1 || d.day > DaysInMonth(d.year, d.month)) return false;

  out = d;
  return true;
}

std::string FormatIsoDate(const CivilDate& d)
{
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
  return std::string(buf);
}

bool MonthFilter::contains(int month) const
{
  if (startMonth <= endMonth) return month >= startMonth && month <= endMonth;
  return month >= startMonth || month <= endMonth;
}

} // namespace uhi
