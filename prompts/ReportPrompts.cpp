#include "ReportPrompts.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace prompts {

namespace {

std::string twoDigits(int value) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d", value);
    return buf;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

}  // namespace

int parseInteger(const std::string& text, const char* field) {
    std::string t = trim(text);
    if (t.empty()) {
        throw std::invalid_argument(std::string("Invalid ") + field + ": empty value");
    }
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(t.c_str(), &end, 10);
    if (errno == ERANGE || !end || *end != '\0' || v < -100000 || v > 100000) {
        throw std::invalid_argument(std::string("Invalid ") + field + ": '" + text + "'");
    }
    return static_cast<int>(v);
}

std::string formatAmount(double value) {
    if (!std::isfinite(value)) {
        return value != value ? "nan" : (value > 0 ? "inf" : "-inf");
    }
    char buf[64];
    if (value == std::floor(value) && std::fabs(value) < 1e16) {
        std::snprintf(buf, sizeof(buf), "%.1f", value);
        return buf;
    }
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
        if (std::strtod(buf, nullptr) == value) break;
    }
    return buf;
}

DateRange monthRange(int year, int month) {
    if (month < 1 || month > 12) {
        throw std::invalid_argument("Invalid month: " + std::to_string(month) + " (expected 1-12)");
    }
    if (year < 1 || year > 9999) {
        throw std::invalid_argument("Invalid year: " + std::to_string(year));
    }
    util::CivilDate first{year, month, 1};
    util::CivilDate last{year, month, util::daysInMonth(year, month)};
    return DateRange{util::formatIsoDate(first), util::formatIsoDate(last)};
}

std::string monthlyReport(const std::string& month,
                          const std::string& year,
                          const util::CivilDate& today) {
    std::string monthText = trim(month).empty() ? std::to_string(today.month) : trim(month);
    std::string yearText  = trim(year).empty() ? std::to_string(today.year) : trim(year);

    const int m = parseInteger(monthText, "month");
    const int y = parseInteger(yearText, "year");
    DateRange range = monthRange(y, m);

    return "Please generate a comprehensive expense report for " + monthText + "/" + yearText + ".\n"
           "\n"
           "1. First, list all expenses from " + range.start + " to " + range.end + "\n"
           "2. Then, summarize the expenses by category\n"
           "3. Calculate the total spending for the month\n"
           "4. Identify the top 3 spending categories\n"
           "5. Provide insights on spending patterns and recommendations for the next month\n"
           "\n"
           "Make the report clear, formatted, and easy to understand.";
}

std::string budgetAnalysis(double budget,
                           const std::optional<std::string>& startDate,
                           const std::optional<std::string>& endDate,
                           const util::CivilDate& today) {
    std::string start = (startDate && !startDate->empty())
                            ? *startDate
                            : std::to_string(today.year) + "-" + twoDigits(today.month) + "-01";
    std::string end = (endDate && !endDate->empty()) ? *endDate : util::formatIsoDate(today);
    const std::string amount = "$" + formatAmount(budget);

    return "Analyze my spending against my budget of " + amount + " for the period " + start +
           " to " + end + ".\n"
           "\n"
           "1. Get all expenses for this period\n"
           "2. Calculate total spending\n"
           "3. Compare against the budget of " + amount + "\n"
           "4. Show spending by category\n"
           "5. Calculate percentage of budget used\n"
           "6. Identify if I'm on track or over budget\n"
           "7. Provide specific recommendations to stay within or get back to budget\n"
           "\n"
           "Present the analysis with clear numbers and actionable advice.";
}

std::string spendingTrends(const std::optional<std::string>& category,
                           int months,
                           const util::CivilDate& today) {
    if (months < 1) {
        throw std::invalid_argument("Invalid months: " + std::to_string(months) + " (expected >= 1)");
    }
    const util::CivilDate start = util::addDays(today, -static_cast<long>(months) * 30);

    const std::string categoryText = (category && !category->empty())
                                         ? " for the '" + *category + "' category"
                                         : std::string(" across all categories");

    return "Analyze my spending trends" + categoryText + " over the past " + std::to_string(months) +
           " months.\n"
           "\n"
           "1. Get expenses from " + util::formatIsoDate(start) + " to " + util::formatIsoDate(today) + "\n"
           "2. Break down spending by month\n"
           "3. Calculate month-over-month changes\n"
           "4. Identify spending patterns (increasing, decreasing, stable)\n"
           "5. Highlight any unusual spikes or drops\n"
           "6. Provide insights on trends and recommendations\n"
           "\n"
           "Present with clear month-by-month comparison.";
}

std::string quickAdd(const std::string& description) {
    return "Add an expense based on this description: \"" + description + "\"\n"
           "\n"
           "Please:\n"
           "1. Extract the amount, category, and any other relevant details\n"
           "2. Use today's date unless a different date is mentioned\n"
           "3. Choose the most appropriate category from available categories\n"
           "4. Add the expense\n"
           "5. Confirm what was added with a summary\n"
           "\n"
           "If anything is unclear, ask for clarification before adding.";
}

} // namespace prompts
