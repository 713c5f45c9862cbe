#include "ExpenseStore.hpp"

#include <stdexcept>
#include <utility>

namespace {

const char* kCreateTableSql =
    "CREATE TABLE IF NOT EXISTS expenses("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " date TEXT NOT NULL,"
    " amount REAL NOT NULL,"
    " category TEXT NOT NULL,"
    " subcategory TEXT DEFAULT '',"
    " note TEXT DEFAULT ''"
    ");";

Expense readExpense(const Statement& st) {
    Expense e;
    e.id          = st.integer(0);
    e.date        = st.text(1);
    e.amount      = st.real(2);
    e.category    = st.text(3);
    e.subcategory = st.text(4);
    e.note        = st.text(5);
    return e;
}

std::string notFoundMessage(std::int64_t id) {
    return "Expense " + std::to_string(id) + " not found";
}

}  // namespace

ExpenseStore::ExpenseStore(std::string dbPath)
    : dbPath_(std::move(dbPath)) {}

void ExpenseStore::initialize() const {
    SqliteConnection db(dbPath_);
    db.exec("PRAGMA journal_mode=WAL;");
    db.exec(kCreateTableSql);

    // canary: fails here, not on the first request, if the file is read-only
    {
        Statement ins = db.prepare(
            "INSERT INTO expenses(date, amount, category) VALUES ('2000-01-01', 0, 'test')");
        ins.step();
    }
    const sqlite3_int64 canaryId = db.lastInsertId();

    Statement del = db.prepare("DELETE FROM expenses WHERE id = ?");
    del.bind(1, canaryId);
    del.step();
}

std::int64_t ExpenseStore::addExpense(const std::string& date,
                                      double             amount,
                                      const std::string& category,
                                      const std::string& subcategory,
                                      const std::string& note) const {
    SqliteConnection db(dbPath_);
    Statement st = db.prepare(
        "INSERT INTO expenses(date, amount, category, subcategory, note) VALUES (?,?,?,?,?)");
    st.bind(1, date);
    st.bind(2, amount);
    st.bind(3, category);
    st.bind(4, subcategory);
    st.bind(5, note);
    st.step();
    return static_cast<std::int64_t>(db.lastInsertId());
}

std::vector<Expense> ExpenseStore::listExpenses(const std::string& startDate,
                                                const std::string& endDate) const {
    SqliteConnection db(dbPath_);
    Statement st = db.prepare(
        "SELECT id, date, amount, category, subcategory, note "
        "FROM expenses "
        "WHERE date BETWEEN ? AND ? "
        "ORDER BY date DESC, id DESC");
    st.bind(1, startDate);
    st.bind(2, endDate);

    std::vector<Expense> out;
    while (st.step()) {
        out.push_back(readExpense(st));
    }
    return out;
}

std::vector<CategorySummary> ExpenseStore::summarize(const std::string&                startDate,
                                                     const std::string&                endDate,
                                                     const std::optional<std::string>& category) const {
    std::string sql =
        "SELECT category, SUM(amount) AS total_amount, COUNT(*) AS count "
        "FROM expenses "
        "WHERE date BETWEEN ? AND ?";
    if (category) {
        sql += " AND category = ?";
    }
    sql += " GROUP BY category ORDER BY total_amount DESC";

    SqliteConnection db(dbPath_);
    Statement st = db.prepare(sql);
    st.bind(1, startDate);
    st.bind(2, endDate);
    if (category) {
        st.bind(3, *category);
    }

    std::vector<CategorySummary> out;
    while (st.step()) {
        CategorySummary s;
        s.category    = st.text(0);
        s.totalAmount = st.real(1);
        s.count       = st.integer(2);
        out.push_back(std::move(s));
    }
    return out;
}

void ExpenseStore::deleteExpense(std::int64_t id) const {
    SqliteConnection db(dbPath_);
    Statement st = db.prepare("DELETE FROM expenses WHERE id = ?");
    st.bind(1, static_cast<sqlite3_int64>(id));
    st.step();
    if (db.changes() == 0) {
        throw StoreError(StoreErrorKind::NotFound, notFoundMessage(id));
    }
}

void ExpenseStore::updateExpense(std::int64_t id, const ExpensePatch& patch) const {
    if (patch.empty()) {
        throw std::invalid_argument("updateExpense: empty patch");
    }

    // column list follows the patch; bind order must match
    std::string assignments;
    auto add = [&assignments](const char* column) {
        if (!assignments.empty()) assignments += ", ";
        assignments += column;
        assignments += " = ?";
    };
    if (patch.date)        add("date");
    if (patch.amount)      add("amount");
    if (patch.category)    add("category");
    if (patch.subcategory) add("subcategory");
    if (patch.note)        add("note");

    SqliteConnection db(dbPath_);
    Statement st = db.prepare("UPDATE expenses SET " + assignments + " WHERE id = ?");

    int idx = 1;
    if (patch.date)        st.bind(idx++, *patch.date);
    if (patch.amount)      st.bind(idx++, *patch.amount);
    if (patch.category)    st.bind(idx++, *patch.category);
    if (patch.subcategory) st.bind(idx++, *patch.subcategory);
    if (patch.note)        st.bind(idx++, *patch.note);
    st.bind(idx, static_cast<sqlite3_int64>(id));

    st.step();
    if (db.changes() == 0) {
        throw StoreError(StoreErrorKind::NotFound, notFoundMessage(id));
    }
}

LedgerStats ExpenseStore::statistics() const {
    SqliteConnection db(dbPath_);
    LedgerStats stats;

    {
        Statement st = db.prepare("SELECT COUNT(*), SUM(amount), MIN(date), MAX(date) FROM expenses");
        if (st.step()) {
            stats.totalExpenses = st.integer(0);
            stats.totalAmount   = st.isNull(1) ? 0.0 : st.real(1);
            if (!st.isNull(2)) stats.firstDate = st.text(2);
            if (!st.isNull(3)) stats.lastDate  = st.text(3);
        }
    }

    Statement st = db.prepare(
        "SELECT category, COUNT(*), SUM(amount) "
        "FROM expenses "
        "GROUP BY category "
        "ORDER BY SUM(amount) DESC");
    while (st.step()) {
        CategoryTotal c;
        c.category = st.text(0);
        c.count    = st.integer(1);
        c.total    = st.real(2);
        stats.byCategory.push_back(std::move(c));
    }
    return stats;
}
