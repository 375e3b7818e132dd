#pragma once

#include <string>

namespace uhi {

// Proleptic Gregorian calendar date (no time of day).
struct CivilDate {
  int year = 1970;
  int month = 1;
  int day = 1;

  bool operator==(const CivilDate& o) const { return year == o.year && month == o.month && day == o.day; }
  bool operator!=(const CivilDate& o) const { return !(*this == o); }
  bool operator<(const CivilDate& o) const;
  bool operator<=(const CivilDate& o) const { return !(o < *this); }
};

// Parse "YYYY", "YYYY-MM" or "YYYY-MM-DD". Missing month/day default to 1.
bool ParseIsoDate(const std::string& s, CivilDate& out);

// Always "YYYY-MM-DD".
std::string FormatIsoDate(const CivilDate& d);

int DaysInMonth(int year, int month);

// Half-open date interval [start, end).
struct DateRange {
  CivilDate start{2023, 1, 1};
  CivilDate end{2024, 1, 1};

  bool contains(const CivilDate& d) const { return start <= d && d < end; }
  bool valid() const { return start < end; }
};

// Inclusive calendar-month filter. startMonth > endMonth wraps the year end
// (e.g. 11..2 keeps Nov, Dec, Jan, Feb).
struct MonthFilter {
  int startMonth = 1;
  int endMonth = 12;

  bool contains(int month) const;
  bool valid() const { return startMonth >= 1 && startMonth <= 12 && endMonth >= 1 && endMonth <= 12; }
};

} // namespace uhi
