#ifndef EXPENSE_BACKEND_HPP
#define EXPENSE_BACKEND_HPP

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "../records/Expense.hpp"
#include "../storage/ExpenseStore.hpp"

using json = nlohmann::ordered_json;

// ----------------------
// 記帳後端：包住 ExpenseStore，給 MCP tools / resources 用
//
// 每個操作都回傳 JSON，儲存層錯誤不往外丟，
// 一律回 { "status": "error", "message": ... }。
// list / summarize 成功時回 JSON array。
// ----------------------

class ExpenseBackend {
public:
    ExpenseBackend(ExpenseStore store, std::string categoriesPath);

    // ---------- Tools ----------

    // { status, id, message }
    json addExpense(const std::string& date,
                    double             amount,
                    const std::string& category,
                    const std::string& subcategory = "",
                    const std::string& note        = "") const;

    json listExpenses(const std::string& startDate,
                      const std::string& endDate) const;

    // category 給空字串 = 不過濾
    json summarizeExpenses(const std::string&                startDate,
                           const std::string&                endDate,
                           const std::optional<std::string>& category = std::nullopt) const;

    json deleteExpense(std::int64_t expenseId) const;

    json updateExpense(std::int64_t expenseId, const ExpensePatch& patch) const;

    // ---------- Resources（回傳序列化後的文字）----------

    std::string categoriesText() const;
    std::string statisticsText() const;
    static std::string helpText();

    const ExpenseStore& store() const { return store_; }

private:
    ExpenseStore store_;
    std::string  categoriesPath_;
};

#endif // EXPENSE_BACKEND_HPP
