#ifndef EXPENSE_MCP_TOOLS_HPP
#define EXPENSE_MCP_TOOLS_HPP

#include <functional>

#include "../backend/ExpenseBackend.hpp"
#include "../helpers/DateUtil.hpp"
#include "McpServer.hpp"

namespace mcp {

using Clock = std::function<util::CivilDate()>;

// Registers the expense tools, report prompts and resources on `server`.
// `backend` is captured by reference and must outlive the server.
void registerExpenseTools(McpServer& server,
                          const ExpenseBackend& backend,
                          Clock today = util::localToday);

} // namespace mcp

#endif // EXPENSE_MCP_TOOLS_HPP
