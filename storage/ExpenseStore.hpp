#ifndef EXPENSE_STORE_HPP
#define EXPENSE_STORE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../records/Expense.hpp"
#include "SqliteConnection.hpp"

// ----------------------
// SQLite-backed expense table.
//
// The store keeps only the database path. Each call opens its own
// connection, runs one statement (statistics: a short fixed sequence of
// reads) and closes it before returning, so instances can be shared freely
// between request threads. All failures are thrown as StoreError.
// ----------------------

class ExpenseStore {
public:
    explicit ExpenseStore(std::string dbPath);

    const std::string& path() const { return dbPath_; }

    // WAL mode + CREATE TABLE IF NOT EXISTS, then a canary insert/delete to
    // prove the file is writable. Meant to run once before serving.
    void initialize() const;

    // Returns the id assigned by SQLite.
    std::int64_t addExpense(const std::string& date,
                            double             amount,
                            const std::string& category,
                            const std::string& subcategory,
                            const std::string& note) const;

    // Inclusive, lexicographic date range; newest date first, then newest id.
    std::vector<Expense> listExpenses(const std::string& startDate,
                                      const std::string& endDate) const;

    // Per-category totals over the range, highest total first.
    std::vector<CategorySummary> summarize(const std::string&                startDate,
                                           const std::string&                endDate,
                                           const std::optional<std::string>& category) const;

    // Throws StoreError(NotFound) when no row has this id.
    void deleteExpense(std::int64_t id) const;

    // Writes only the columns present in the patch. The patch must not be
    // empty. Throws StoreError(NotFound) when no row has this id.
    void updateExpense(std::int64_t id, const ExpensePatch& patch) const;

    LedgerStats statistics() const;

private:
    std::string dbPath_;
};

#endif // EXPENSE_STORE_HPP
