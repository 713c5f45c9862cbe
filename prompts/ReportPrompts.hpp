#ifndef EXPENSE_REPORT_PROMPTS_HPP
#define EXPENSE_REPORT_PROMPTS_HPP

#include <optional>
#include <string>

#include "../helpers/DateUtil.hpp"

// ----------------------
// Report prompt templates.
//
// Pure text builders: they compute a date range and return instructions for
// the calling agent, which then runs the expense tools itself. "today" is
// passed in so callers (and tests) control the clock. Malformed numeric
// arguments throw std::invalid_argument.
// ----------------------

namespace prompts {

struct DateRange {
    std::string start;   // YYYY-MM-DD
    std::string end;     // YYYY-MM-DD, inclusive
};

// First through last calendar day of the month.
DateRange monthRange(int year, int month);

// month: "1".."12" (leading zero allowed), year: "YYYY".
// Either may be empty to use today's month / year.
std::string monthlyReport(const std::string& month,
                          const std::string& year,
                          const util::CivilDate& today);

// Missing start defaults to the first of the current month, missing end to today.
std::string budgetAnalysis(double budget,
                           const std::optional<std::string>& startDate,
                           const std::optional<std::string>& endDate,
                           const util::CivilDate& today);

// Looks back months * 30 days from today.
std::string spendingTrends(const std::optional<std::string>& category,
                           int months,
                           const util::CivilDate& today);

std::string quickAdd(const std::string& description);

// Shortest decimal form with at least one fractional digit: 2000 -> "2000.0".
std::string formatAmount(double value);

// Whole-string integer parse; throws std::invalid_argument naming the field.
int parseInteger(const std::string& text, const char* field);

constexpr int kDefaultTrendMonths = 3;

} // namespace prompts

#endif // EXPENSE_REPORT_PROMPTS_HPP
