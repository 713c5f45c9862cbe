#ifndef EXPENSE_HPP
#define EXPENSE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

struct Expense {
    std::int64_t id = 0;
    std::string  date;          // "YYYY-MM-DD"，不做檢查
    double       amount = 0.0;
    std::string  category;
    std::string  subcategory;
    std::string  note;
};

// 部分更新：只寫入有值的欄位
struct ExpensePatch {
    std::optional<std::string> date;
    std::optional<double>      amount;
    std::optional<std::string> category;
    std::optional<std::string> subcategory;
    std::optional<std::string> note;

    bool empty() const {
        return !date && !amount && !category && !subcategory && !note;
    }
};

struct CategorySummary {
    std::string  category;
    double       totalAmount = 0.0;
    std::int64_t count = 0;
};

struct CategoryTotal {
    std::string  category;
    std::int64_t count = 0;
    double       total = 0.0;
};

struct LedgerStats {
    std::int64_t               totalExpenses = 0;
    double                     totalAmount   = 0.0;
    std::optional<std::string> firstDate;
    std::optional<std::string> lastDate;
    std::vector<CategoryTotal> byCategory;   // 依 total 由大到小
};

// ----------------------
// 回給 client 的 JSON 格式
// ----------------------

nlohmann::ordered_json toJson(const Expense& e);
nlohmann::ordered_json toJson(const std::vector<Expense>& expenses);
nlohmann::ordered_json toJson(const CategorySummary& s);
nlohmann::ordered_json toJson(const std::vector<CategorySummary>& summaries);
nlohmann::ordered_json toJson(const LedgerStats& stats);

#endif // EXPENSE_HPP
