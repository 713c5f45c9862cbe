#ifndef EXPENSE_MCP_ARGUMENTS_HPP
#define EXPENSE_MCP_ARGUMENTS_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "McpServer.hpp"

// Typed access to a tools/call or prompts/get "arguments" object.
// Absent and null both mean "not supplied". Wrong types throw
// McpError(INVALID_PARAMS) naming the argument.

namespace mcp::args {

std::string                requireString(const json& args, const std::string& key);
std::optional<std::string> optionalString(const json& args, const std::string& key);

double                requireNumber(const json& args, const std::string& key);
std::optional<double> optionalNumber(const json& args, const std::string& key);

std::int64_t requireInteger(const json& args, const std::string& key);

// Prompt arguments arrive as strings; numbers are accepted and rendered as text.
std::optional<std::string> optionalText(const json& args, const std::string& key);

} // namespace mcp::args

#endif // EXPENSE_MCP_ARGUMENTS_HPP
