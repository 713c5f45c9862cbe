#include "ExpenseTools.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <utility>

#include "../prompts/ReportPrompts.hpp"
#include "Arguments.hpp"

namespace mcp {

namespace {

json property(const char* type, const char* description) {
    json p;
    p["type"]        = type;
    p["description"] = description;
    return p;
}

json objectSchema(json properties, std::vector<std::string> required) {
    json schema;
    schema["type"]       = "object";
    schema["properties"] = std::move(properties);
    schema["required"]   = required;
    return schema;
}

double parseDecimal(const std::string& text, const char* field) {
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    while (end && (*end == ' ' || *end == '\t')) ++end;
    if (text.empty() || errno == ERANGE || !end || *end != '\0' || !std::isfinite(v)) {
        throw std::invalid_argument(std::string("Invalid ") + field + ": '" + text + "'");
    }
    return v;
}

// ----------------------
// Tools
// ----------------------

void addTools(McpServer& server, const ExpenseBackend& backend) {
    {
        json props;
        props["date"]        = property("string", "Date in YYYY-MM-DD format");
        props["amount"]      = property("number", "Amount spent (positive number)");
        props["category"]    = property("string", "Expense category (e.g., \"Food & Dining\", \"Transportation\")");
        props["subcategory"] = property("string", "Optional subcategory for more detail");
        props["note"]        = property("string", "Optional note or description");
        props["subcategory"]["default"] = "";
        props["note"]["default"]        = "";

        server.addTool(ToolDefinition{
            "add_expense",
            "Add a new expense entry to the database.",
            objectSchema(props, {"date", "amount", "category"}),
            [&backend](const json& a) {
                return backend.addExpense(args::requireString(a, "date"),
                                          args::requireNumber(a, "amount"),
                                          args::requireString(a, "category"),
                                          args::optionalString(a, "subcategory").value_or(""),
                                          args::optionalString(a, "note").value_or(""));
            }});
    }

    {
        json props;
        props["start_date"] = property("string", "Start date in YYYY-MM-DD format");
        props["end_date"]   = property("string", "End date in YYYY-MM-DD format");

        server.addTool(ToolDefinition{
            "list_expenses",
            "List expense entries within an inclusive date range, newest first.",
            objectSchema(props, {"start_date", "end_date"}),
            [&backend](const json& a) {
                return backend.listExpenses(args::requireString(a, "start_date"),
                                            args::requireString(a, "end_date"));
            }});
    }

    {
        json props;
        props["start_date"] = property("string", "Start date in YYYY-MM-DD format");
        props["end_date"]   = property("string", "End date in YYYY-MM-DD format");
        props["category"]   = property("string", "Optional category to filter by");

        server.addTool(ToolDefinition{
            "summarize_expenses",
            "Summarize expenses by category within an inclusive date range.",
            objectSchema(props, {"start_date", "end_date"}),
            [&backend](const json& a) {
                return backend.summarizeExpenses(args::requireString(a, "start_date"),
                                                 args::requireString(a, "end_date"),
                                                 args::optionalString(a, "category"));
            }});
    }

    {
        json props;
        props["expense_id"] = property("integer", "The ID of the expense to delete");

        server.addTool(ToolDefinition{
            "delete_expense",
            "Delete an expense entry by ID.",
            objectSchema(props, {"expense_id"}),
            [&backend](const json& a) {
                return backend.deleteExpense(args::requireInteger(a, "expense_id"));
            }});
    }

    {
        json props;
        props["expense_id"]  = property("integer", "The ID of the expense to update");
        props["date"]        = property("string", "New date in YYYY-MM-DD format (optional)");
        props["amount"]      = property("number", "New amount (optional)");
        props["category"]    = property("string", "New category (optional)");
        props["subcategory"] = property("string", "New subcategory (optional)");
        props["note"]        = property("string", "New note (optional)");

        server.addTool(ToolDefinition{
            "update_expense",
            "Update an existing expense entry. Only provided fields will be updated.",
            objectSchema(props, {"expense_id"}),
            [&backend](const json& a) {
                const std::int64_t id = args::requireInteger(a, "expense_id");
                ExpensePatch patch;
                patch.date        = args::optionalString(a, "date");
                patch.amount      = args::optionalNumber(a, "amount");
                patch.category    = args::optionalString(a, "category");
                patch.subcategory = args::optionalString(a, "subcategory");
                patch.note        = args::optionalString(a, "note");
                return backend.updateExpense(id, patch);
            }});
    }
}

// ----------------------
// Prompts
// ----------------------

void addPrompts(McpServer& server, const Clock& today) {
    server.addPrompt(PromptDefinition{
        "monthly_report",
        "Generate a comprehensive monthly expense report.",
        {{"month", "Month number (1-12), defaults to current month", false},
         {"year", "Year (YYYY), defaults to current year", false}},
        [today](const json& a) {
            return prompts::monthlyReport(args::optionalText(a, "month").value_or(""),
                                          args::optionalText(a, "year").value_or(""),
                                          today());
        }});

    server.addPrompt(PromptDefinition{
        "budget_analysis",
        "Analyze spending against a budget.",
        {{"budget", "Total budget amount", true},
         {"start_date", "Start date (YYYY-MM-DD), defaults to current month start", false},
         {"end_date", "End date (YYYY-MM-DD), defaults to today", false}},
        [today](const json& a) {
            const double budget = parseDecimal(*args::optionalText(a, "budget"), "budget");
            return prompts::budgetAnalysis(budget,
                                           args::optionalText(a, "start_date"),
                                           args::optionalText(a, "end_date"),
                                           today());
        }});

    server.addPrompt(PromptDefinition{
        "spending_trends",
        "Analyze spending trends over time.",
        {{"category", "Optional category to analyze (analyzes all if not specified)", false},
         {"months", "Number of months to analyze (default 3)", false}},
        [today](const json& a) {
            int months = prompts::kDefaultTrendMonths;
            auto monthsText = args::optionalText(a, "months");
            if (monthsText && !monthsText->empty()) {
                months = prompts::parseInteger(*monthsText, "months");
            }
            return prompts::spendingTrends(args::optionalText(a, "category"), months, today());
        }});

    server.addPrompt(PromptDefinition{
        "quick_add",
        "Quick add an expense from natural language description.",
        {{"description", "Natural language description (e.g., \"coffee $5.50 this morning\")", true}},
        [](const json& a) {
            return prompts::quickAdd(*args::optionalText(a, "description"));
        }});
}

// ----------------------
// Resources
// ----------------------

void addResources(McpServer& server, const ExpenseBackend& backend) {
    server.addResource(ResourceDefinition{
        "expense:///categories",
        "categories",
        "Available expense categories and their subcategories.",
        "application/json",
        [&backend]() { return backend.categoriesText(); }});

    server.addResource(ResourceDefinition{
        "expense:///stats",
        "stats",
        "Overall expense statistics: totals, date range, per-category breakdown.",
        "application/json",
        [&backend]() { return backend.statisticsText(); }});

    server.addResource(ResourceDefinition{
        "expense:///help",
        "help",
        "Help documentation for the expense tracker.",
        "text/markdown",
        []() { return ExpenseBackend::helpText(); }});
}

}  // namespace

void registerExpenseTools(McpServer& server, const ExpenseBackend& backend, Clock today) {
    addTools(server, backend);
    addPrompts(server, today);
    addResources(server, backend);
}

} // namespace mcp
