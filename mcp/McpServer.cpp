#include "McpServer.hpp"

#include <utility>

#include "../helpers/Logger.hpp"

namespace mcp {

namespace {

template <typename T>
void upsert(std::vector<T>& items, std::map<std::string, std::size_t>& index,
            const std::string& key, T item) {
    auto it = index.find(key);
    if (it != index.end()) {
        items[it->second] = std::move(item);
        return;
    }
    index[key] = items.size();
    items.push_back(std::move(item));
}

const json& requireObjectParams(const json& params) {
    if (!params.is_object()) {
        throw McpError(rpc_error::INVALID_PARAMS, "params must be an object");
    }
    return params;
}

std::string requireName(const json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_string()) {
        throw McpError(rpc_error::INVALID_PARAMS, std::string("Missing or invalid '") + key + "'");
    }
    return it->get<std::string>();
}

json argumentsOf(const json& params) {
    auto it = params.find("arguments");
    if (it == params.end() || it->is_null()) return json::object();
    if (!it->is_object()) {
        throw McpError(rpc_error::INVALID_PARAMS, "'arguments' must be an object");
    }
    return *it;
}

json textContent(const std::string& text) {
    json item;
    item["type"] = "text";
    item["text"] = text;
    return item;
}

}  // namespace

McpServer::McpServer(std::string name, std::string version)
    : name_(std::move(name)), version_(std::move(version)) {}

void McpServer::addTool(ToolDefinition tool) {
    const std::string key = tool.name;
    upsert(tools_, toolIndex_, key, std::move(tool));
}

void McpServer::addPrompt(PromptDefinition prompt) {
    const std::string key = prompt.name;
    upsert(prompts_, promptIndex_, key, std::move(prompt));
}

void McpServer::addResource(ResourceDefinition resource) {
    const std::string key = resource.uri;
    upsert(resources_, resourceIndex_, key, std::move(resource));
}

std::vector<std::string> McpServer::toolNames() const {
    std::vector<std::string> out;
    for (const auto& t : tools_) out.push_back(t.name);
    return out;
}

std::vector<std::string> McpServer::promptNames() const {
    std::vector<std::string> out;
    for (const auto& p : prompts_) out.push_back(p.name);
    return out;
}

std::vector<std::string> McpServer::resourceUris() const {
    std::vector<std::string> out;
    for (const auto& r : resources_) out.push_back(r.uri);
    return out;
}

json McpServer::makeResult(const json& id, const json& result) {
    json j;
    j["jsonrpc"] = "2.0";
    j["id"]      = id;
    j["result"]  = result;
    return j;
}

json McpServer::makeError(const json& id, int code, const std::string& message) {
    json err;
    err["code"]    = code;
    err["message"] = message;
    json j;
    j["jsonrpc"] = "2.0";
    j["id"]      = id;
    j["error"]   = err;
    return j;
}

// ----------------------
// Entry points
// ----------------------

json McpServer::handleMessage(const json& message) {
    if (!message.is_array()) {
        return handle(message);
    }
    if (message.empty()) {
        return makeError(nullptr, rpc_error::INVALID_REQUEST, "Empty batch");
    }
    json responses = json::array();
    for (const auto& item : message) {
        json r = handle(item);
        if (!r.is_null()) responses.push_back(std::move(r));
    }
    if (responses.empty()) return json();
    return responses;
}

json McpServer::handle(const json& request) {
    if (!request.is_object()) {
        return makeError(nullptr, rpc_error::INVALID_REQUEST, "Request must be a JSON object");
    }

    const bool isNotification = !request.contains("id");
    const json id = request.value("id", json());

    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        return makeError(id, rpc_error::INVALID_REQUEST, "Missing or invalid jsonrpc version");
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        return makeError(id, rpc_error::INVALID_REQUEST, "Missing or invalid method");
    }

    const std::string method = request["method"].get<std::string>();
    const json params = request.value("params", json::object());

    if (isNotification) {
        // notifications/initialized, notifications/cancelled, ...: nothing to answer
        util::Logger::debug("mcp notification: " + method);
        return json();
    }

    util::Logger::debug("mcp request: " + method + " id=" + id.dump());
    try {
        return makeResult(id, dispatch(method, params));
    } catch (const McpError& e) {
        util::Logger::warn("mcp " + method + " failed (" + std::to_string(e.code()) + "): " + e.what());
        return makeError(id, e.code(), e.what());
    } catch (const std::exception& e) {
        util::Logger::error("mcp " + method + " internal error: " + e.what());
        return makeError(id, rpc_error::INTERNAL_ERROR, std::string("Internal error: ") + e.what());
    }
}

json McpServer::dispatch(const std::string& method, const json& params) {
    if (method == "initialize")     return handleInitialize(params);
    if (method == "ping")           return json::object();
    if (method == "tools/list")     return handleToolsList();
    if (method == "tools/call")     return handleToolsCall(requireObjectParams(params));
    if (method == "prompts/list")   return handlePromptsList();
    if (method == "prompts/get")    return handlePromptsGet(requireObjectParams(params));
    if (method == "resources/list") return handleResourcesList();
    if (method == "resources/read") return handleResourcesRead(requireObjectParams(params));

    throw McpError(rpc_error::METHOD_NOT_FOUND, "Unknown method: " + method);
}

// ----------------------
// Methods
// ----------------------

json McpServer::handleInitialize(const json& params) const {
    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        util::Logger::info("mcp initialize from " + params["clientInfo"].value("name", std::string("?")));
    }

    json capabilities;
    capabilities["tools"]     = json{{"listChanged", false}};
    capabilities["prompts"]   = json{{"listChanged", false}};
    capabilities["resources"] = json{{"subscribe", false}, {"listChanged", false}};

    json serverInfo;
    serverInfo["name"]    = name_;
    serverInfo["version"] = version_;

    json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"]    = capabilities;
    result["serverInfo"]      = serverInfo;
    return result;
}

json McpServer::handleToolsList() const {
    json arr = json::array();
    for (const auto& t : tools_) {
        json jt;
        jt["name"]        = t.name;
        jt["description"] = t.description;
        jt["inputSchema"] = t.inputSchema;
        arr.push_back(jt);
    }
    json result;
    result["tools"] = arr;
    return result;
}

json McpServer::handleToolsCall(const json& params) {
    const std::string name = requireName(params, "name");
    auto it = toolIndex_.find(name);
    if (it == toolIndex_.end()) {
        throw McpError(rpc_error::INVALID_PARAMS, "Unknown tool: " + name);
    }
    const json arguments = argumentsOf(params);
    const ToolDefinition& tool = tools_[it->second];

    json result;
    try {
        json value = tool.handler(arguments);

        result["content"] = json::array({textContent(value.dump())});
        if (value.is_object()) {
            result["structuredContent"] = value;
        } else {
            result["structuredContent"] = json{{"result", value}};
        }
        result["isError"] = false;
    } catch (const std::exception& e) {
        // execution errors are reported in-band so the model can see them
        util::Logger::warn("tool " + name + " failed: " + e.what());
        result["content"] = json::array({textContent("Error executing tool " + name + ": " + e.what())});
        result["isError"] = true;
    }
    return result;
}

json McpServer::handlePromptsList() const {
    json arr = json::array();
    for (const auto& p : prompts_) {
        json jp;
        jp["name"]        = p.name;
        jp["description"] = p.description;
        json args = json::array();
        for (const auto& a : p.arguments) {
            json ja;
            ja["name"]        = a.name;
            ja["description"] = a.description;
            ja["required"]    = a.required;
            args.push_back(ja);
        }
        jp["arguments"] = args;
        arr.push_back(jp);
    }
    json result;
    result["prompts"] = arr;
    return result;
}

json McpServer::handlePromptsGet(const json& params) {
    const std::string name = requireName(params, "name");
    auto it = promptIndex_.find(name);
    if (it == promptIndex_.end()) {
        throw McpError(rpc_error::INVALID_PARAMS, "Unknown prompt: " + name);
    }
    const PromptDefinition& prompt = prompts_[it->second];
    const json arguments = argumentsOf(params);

    for (const auto& a : prompt.arguments) {
        if (a.required && (!arguments.contains(a.name) || arguments[a.name].is_null())) {
            throw McpError(rpc_error::INVALID_PARAMS, "Missing required argument '" + a.name + "'");
        }
    }

    std::string text;
    try {
        text = prompt.handler(arguments);
    } catch (const std::invalid_argument& e) {
        throw McpError(rpc_error::INVALID_PARAMS, e.what());
    }

    json message;
    message["role"]    = "user";
    message["content"] = textContent(text);

    json result;
    result["description"] = prompt.description;
    result["messages"]    = json::array({message});
    return result;
}

json McpServer::handleResourcesList() const {
    json arr = json::array();
    for (const auto& r : resources_) {
        json jr;
        jr["uri"]         = r.uri;
        jr["name"]        = r.name;
        jr["description"] = r.description;
        jr["mimeType"]    = r.mimeType;
        arr.push_back(jr);
    }
    json result;
    result["resources"] = arr;
    return result;
}

json McpServer::handleResourcesRead(const json& params) {
    const std::string uri = requireName(params, "uri");
    auto it = resourceIndex_.find(uri);
    if (it == resourceIndex_.end()) {
        throw McpError(rpc_error::RESOURCE_NOT_FOUND, "Unknown resource: " + uri);
    }
    const ResourceDefinition& resource = resources_[it->second];

    json content;
    content["uri"]      = resource.uri;
    content["mimeType"] = resource.mimeType;
    content["text"]     = resource.reader();

    json result;
    result["contents"] = json::array({content});
    return result;
}

} // namespace mcp
