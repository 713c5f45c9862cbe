#include "Expense.hpp"

using json = nlohmann::ordered_json;

json toJson(const Expense& e) {
    json j;
    j["id"]          = e.id;
    j["date"]        = e.date;
    j["amount"]      = e.amount;
    j["category"]    = e.category;
    j["subcategory"] = e.subcategory;
    j["note"]        = e.note;
    return j;
}

json toJson(const std::vector<Expense>& expenses) {
    json arr = json::array();
    for (const auto& e : expenses) {
        arr.push_back(toJson(e));
    }
    return arr;
}

json toJson(const CategorySummary& s) {
    json j;
    j["category"]     = s.category;
    j["total_amount"] = s.totalAmount;
    j["count"]        = s.count;
    return j;
}

json toJson(const std::vector<CategorySummary>& summaries) {
    json arr = json::array();
    for (const auto& s : summaries) {
        arr.push_back(toJson(s));
    }
    return arr;
}

json toJson(const LedgerStats& stats) {
    json j;
    j["total_expenses"] = stats.totalExpenses;
    j["total_amount"]   = stats.totalAmount;

    json range;
    range["first_expense"] = stats.firstDate ? json(*stats.firstDate) : json(nullptr);
    range["last_expense"]  = stats.lastDate ? json(*stats.lastDate) : json(nullptr);
    j["date_range"] = range;

    json byCategory = json::array();
    for (const auto& c : stats.byCategory) {
        json jc;
        jc["category"] = c.category;
        jc["count"]    = c.count;
        jc["total"]    = c.total;
        byCategory.push_back(jc);
    }
    j["by_category"] = byCategory;
    return j;
}
