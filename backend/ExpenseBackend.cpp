#include "ExpenseBackend.hpp"

#include <utility>

#include "../helpers/Logger.hpp"
#include "../records/Categories.hpp"

namespace {

json success(const std::string& message) {
    json j;
    j["status"]  = "success";
    j["message"] = message;
    return j;
}

json failure(const std::string& message) {
    json j;
    j["status"]  = "error";
    j["message"] = message;
    return j;
}

std::string expenseLabel(std::int64_t id) {
    return "Expense " + std::to_string(id);
}

}  // namespace

ExpenseBackend::ExpenseBackend(ExpenseStore store, std::string categoriesPath)
    : store_(std::move(store)), categoriesPath_(std::move(categoriesPath)) {}

// ----------------------
// Tools
// ----------------------

json ExpenseBackend::addExpense(const std::string& date,
                                double             amount,
                                const std::string& category,
                                const std::string& subcategory,
                                const std::string& note) const {
    try {
        std::int64_t id = store_.addExpense(date, amount, category, subcategory, note);
        util::Logger::info("add_expense: id=" + std::to_string(id) + " date=" + date +
                           " category=" + category);
        json out;
        out["status"]  = "success";
        out["id"]      = id;
        out["message"] = "Expense added successfully";
        return out;
    } catch (const StoreError& e) {
        util::Logger::warn(std::string("add_expense failed (") + storeErrorKindName(e.kind()) +
                           "): " + e.what());
        if (e.kind() == StoreErrorKind::PermissionDenied) {
            return failure("Database is in read-only mode. Check file permissions.");
        }
        return failure(std::string("Database error: ") + e.what());
    } catch (const std::exception& e) {
        util::Logger::warn(std::string("add_expense failed: ") + e.what());
        return failure(std::string("Database error: ") + e.what());
    }
}

json ExpenseBackend::listExpenses(const std::string& startDate,
                                  const std::string& endDate) const {
    try {
        auto rows = store_.listExpenses(startDate, endDate);
        util::Logger::debug("list_expenses: " + startDate + ".." + endDate + " -> " +
                            std::to_string(rows.size()) + " rows");
        return toJson(rows);
    } catch (const std::exception& e) {
        util::Logger::warn(std::string("list_expenses failed: ") + e.what());
        return failure(std::string("Error listing expenses: ") + e.what());
    }
}

json ExpenseBackend::summarizeExpenses(const std::string&                startDate,
                                       const std::string&                endDate,
                                       const std::optional<std::string>& category) const {
    std::optional<std::string> filter;
    if (category && !category->empty()) filter = category;

    try {
        auto rows = store_.summarize(startDate, endDate, filter);
        util::Logger::debug("summarize_expenses: " + startDate + ".." + endDate +
                            (filter ? " category=" + *filter : std::string()) + " -> " +
                            std::to_string(rows.size()) + " categories");
        return toJson(rows);
    } catch (const std::exception& e) {
        util::Logger::warn(std::string("summarize_expenses failed: ") + e.what());
        return failure(std::string("Error summarizing expenses: ") + e.what());
    }
}

json ExpenseBackend::deleteExpense(std::int64_t expenseId) const {
    try {
        store_.deleteExpense(expenseId);
        util::Logger::info("delete_expense: id=" + std::to_string(expenseId));
        return success(expenseLabel(expenseId) + " deleted");
    } catch (const StoreError& e) {
        if (e.kind() == StoreErrorKind::NotFound) {
            util::Logger::info("delete_expense: id=" + std::to_string(expenseId) + " not found");
            return failure(expenseLabel(expenseId) + " not found");
        }
        util::Logger::warn(std::string("delete_expense failed: ") + e.what());
        return failure(std::string("Error deleting expense: ") + e.what());
    } catch (const std::exception& e) {
        util::Logger::warn(std::string("delete_expense failed: ") + e.what());
        return failure(std::string("Error deleting expense: ") + e.what());
    }
}

json ExpenseBackend::updateExpense(std::int64_t expenseId, const ExpensePatch& patch) const {
    if (patch.empty()) {
        return failure("No fields to update");
    }

    try {
        store_.updateExpense(expenseId, patch);
        util::Logger::info("update_expense: id=" + std::to_string(expenseId));
        return success(expenseLabel(expenseId) + " updated");
    } catch (const StoreError& e) {
        if (e.kind() == StoreErrorKind::NotFound) {
            util::Logger::info("update_expense: id=" + std::to_string(expenseId) + " not found");
            return failure(expenseLabel(expenseId) + " not found");
        }
        util::Logger::warn(std::string("update_expense failed: ") + e.what());
        return failure(std::string("Error updating expense: ") + e.what());
    } catch (const std::exception& e) {
        util::Logger::warn(std::string("update_expense failed: ") + e.what());
        return failure(std::string("Error updating expense: ") + e.what());
    }
}

// ----------------------
// Resources
// ----------------------

std::string ExpenseBackend::categoriesText() const {
    CategoryDocument doc = loadCategoryDocument(categoriesPath_);
    if (doc.source == CategorySource::BuiltIn) {
        util::Logger::debug("categories: " + categoriesPath_ + " not readable, using built-in list");
    }
    return doc.text;
}

std::string ExpenseBackend::statisticsText() const {
    try {
        return toJson(store_.statistics()).dump(2);
    } catch (const std::exception& e) {
        util::Logger::warn(std::string("statistics failed: ") + e.what());
        json err;
        err["error"] = e.what();
        return err.dump();
    }
}

std::string ExpenseBackend::helpText() {
    return R"(# Expense Tracker Help

## Available Tools

### add_expense
Add a new expense to the tracker.
- **date**: Date in YYYY-MM-DD format
- **amount**: Amount spent (positive number)
- **category**: One of the available categories
- **subcategory** (optional): Subcategory for more detail
- **note** (optional): Additional notes

### list_expenses
List expenses within a date range (both ends included), newest first.
- **start_date**: Start date (YYYY-MM-DD)
- **end_date**: End date (YYYY-MM-DD)

### summarize_expenses
Get spending summary by category, highest total first.
- **start_date**: Start date (YYYY-MM-DD)
- **end_date**: End date (YYYY-MM-DD)
- **category** (optional): Filter by specific category

### delete_expense
Delete an expense by ID.
- **expense_id**: The ID of the expense to delete

### update_expense
Update an existing expense. Only the fields you pass are changed.
- **expense_id**: The ID to update
- **date**, **amount**, **category**, **subcategory**, **note** (all optional)

## Available Prompts

### monthly_report
Generate a comprehensive monthly expense report.
- **month** (optional): Month number 1-12, defaults to the current month
- **year** (optional): Year (YYYY), defaults to the current year

### budget_analysis
Analyze spending against a budget.
- **budget**: Total budget amount
- **start_date** / **end_date** (optional): default to this month so far

### spending_trends
Analyze spending patterns over time.
- **category** (optional): Category to analyze, all if omitted
- **months** (optional): Number of months to look back (default 3)

### quick_add
Add expense from natural language.
- **description**: e.g. "coffee $5.50 this morning"

## Available Resources

- `expense:///categories`: categories and subcategories (JSON)
- `expense:///stats`: totals, date range and per-category breakdown (JSON)
- `expense:///help`: this document

## Example Queries

- "Add a $45.50 expense for groceries today"
- "Show me all my expenses from January"
- "What did I spend on food last month?"
- "Change the amount of expense 12 to 30"
- "Delete expense 7"
- "Generate a monthly report for December 2024"
- "Am I within my $2000 budget this month?"
- "Show spending trends for the past 3 months"
)";
}
