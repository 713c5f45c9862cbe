#ifndef EXPENSE_MCP_SERVER_HPP
#define EXPENSE_MCP_SERVER_HPP

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp {

using json = nlohmann::ordered_json;

constexpr const char* kProtocolVersion = "2024-11-05";

namespace rpc_error {
constexpr int PARSE_ERROR        = -32700;
constexpr int INVALID_REQUEST    = -32600;
constexpr int METHOD_NOT_FOUND   = -32601;
constexpr int INVALID_PARAMS     = -32602;
constexpr int INTERNAL_ERROR     = -32603;
constexpr int RESOURCE_NOT_FOUND = -32002;
}  // namespace rpc_error

// Protocol-level failure; becomes a JSON-RPC error object.
class McpError : public std::runtime_error {
public:
    McpError(int code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

// ----------------------
// Registry entries
// ----------------------

// Returns the tool's value: an object or an array.
using ToolHandler = std::function<json(const json& arguments)>;

struct ToolDefinition {
    std::string name;
    std::string description;
    json        inputSchema;   // JSON Schema object
    ToolHandler handler;
};

struct PromptArgument {
    std::string name;
    std::string description;
    bool        required = false;
};

// Returns the text of the single user message.
using PromptHandler = std::function<std::string(const json& arguments)>;

struct PromptDefinition {
    std::string                 name;
    std::string                 description;
    std::vector<PromptArgument> arguments;
    PromptHandler               handler;
};

using ResourceReader = std::function<std::string()>;

struct ResourceDefinition {
    std::string    uri;
    std::string    name;
    std::string    description;
    std::string    mimeType;
    ResourceReader reader;
};

// ----------------------
// JSON-RPC 2.0 dispatcher for the MCP methods we serve. Transport agnostic:
// the HTTP and stdio front ends both feed parsed messages to handleMessage().
// ----------------------

class McpServer {
public:
    McpServer(std::string name, std::string version);

    void addTool(ToolDefinition tool);
    void addPrompt(PromptDefinition prompt);
    void addResource(ResourceDefinition resource);

    std::vector<std::string> toolNames() const;
    std::vector<std::string> promptNames() const;
    std::vector<std::string> resourceUris() const;

    // Single request or batch array. Returns null when nothing needs to be
    // sent back (notifications only).
    json handleMessage(const json& message);

    // One request object; null for notifications.
    json handle(const json& request);

    static json makeResult(const json& id, const json& result);
    static json makeError(const json& id, int code, const std::string& message);

private:
    json dispatch(const std::string& method, const json& params);

    json handleInitialize(const json& params) const;
    json handleToolsList() const;
    json handleToolsCall(const json& params);
    json handlePromptsList() const;
    json handlePromptsGet(const json& params);
    json handleResourcesList() const;
    json handleResourcesRead(const json& params);

    std::string name_;
    std::string version_;

    // registration order is the listing order
    std::vector<ToolDefinition>     tools_;
    std::vector<PromptDefinition>   prompts_;
    std::vector<ResourceDefinition> resources_;
    std::map<std::string, std::size_t> toolIndex_;
    std::map<std::string, std::size_t> promptIndex_;
    std::map<std::string, std::size_t> resourceIndex_;
};

} // namespace mcp

#endif // EXPENSE_MCP_SERVER_HPP
