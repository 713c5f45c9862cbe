#ifndef EXPENSE_DATE_UTIL_HPP
#define EXPENSE_DATE_UTIL_HPP

#include <string>

namespace util {

// Proleptic Gregorian calendar date, no time zone.
struct CivilDate {
    int year  = 1970;
    int month = 1;   // 1..12
    int day   = 1;   // 1..daysInMonth
};

bool isLeapYear(int year);
int  daysInMonth(int year, int month);

// Days since 1970-01-01 and back.
long      toDayNumber(const CivilDate& d);
CivilDate fromDayNumber(long days);

CivilDate addDays(const CivilDate& d, long delta);

// "YYYY-MM-DD", zero padded
std::string formatIsoDate(const CivilDate& d);

// Local calendar date of the running process.
CivilDate localToday();

} // namespace util

#endif // EXPENSE_DATE_UTIL_HPP
