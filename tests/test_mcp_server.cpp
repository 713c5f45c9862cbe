#include <stdexcept>

#include <gtest/gtest.h>

#include "helpers/Logger.hpp"
#include "mcp/Arguments.hpp"
#include "mcp/McpServer.hpp"

using mcp::json;

namespace {

json request(int id, const std::string& method, json params = json::object()) {
    json r;
    r["jsonrpc"] = "2.0";
    r["id"]      = id;
    r["method"]  = method;
    r["params"]  = std::move(params);
    return r;
}

class McpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        util::Logger::init("", util::LogLevel::Error, stderr);

        json schema;
        schema["type"] = "object";
        server_.addTool(mcp::ToolDefinition{
            "echo", "Echo the text back", schema,
            [](const json& a) {
                json out;
                out["text"] = mcp::args::requireString(a, "text");
                return out;
            }});
        server_.addTool(mcp::ToolDefinition{
            "numbers", "Return a list", schema,
            [](const json&) { return json::array({1, 2, 3}); }});
        server_.addTool(mcp::ToolDefinition{
            "explode", "Always fails", schema,
            [](const json&) -> json { throw std::runtime_error("boom"); }});

        server_.addPrompt(mcp::PromptDefinition{
            "greet", "Say hello",
            {{"name", "Who to greet", true}},
            [](const json& a) {
                const std::string who = *mcp::args::optionalText(a, "name");
                if (who == "nobody") throw std::invalid_argument("Invalid name");
                return "Hello, " + who;
            }});

        server_.addResource(mcp::ResourceDefinition{
            "test:///static", "static", "A fixed document", "text/plain",
            []() { return std::string("fixed"); }});
    }

    mcp::McpServer server_{"TestServer", "9.9.9"};
};

}  // namespace

TEST_F(McpServerTest, InitializeReportsCapabilities) {
    json r = server_.handle(request(1, "initialize", json{{"clientInfo", json{{"name", "tester"}}}}));
    EXPECT_EQ(r["jsonrpc"], "2.0");
    EXPECT_EQ(r["id"], 1);
    EXPECT_EQ(r["result"]["protocolVersion"], mcp::kProtocolVersion);
    EXPECT_EQ(r["result"]["serverInfo"]["name"], "TestServer");
    EXPECT_EQ(r["result"]["serverInfo"]["version"], "9.9.9");
    EXPECT_TRUE(r["result"]["capabilities"].contains("tools"));
    EXPECT_TRUE(r["result"]["capabilities"].contains("prompts"));
    EXPECT_TRUE(r["result"]["capabilities"].contains("resources"));
}

TEST_F(McpServerTest, NotificationsGetNoResponse) {
    json n;
    n["jsonrpc"] = "2.0";
    n["method"]  = "notifications/initialized";
    EXPECT_TRUE(server_.handle(n).is_null());
    EXPECT_TRUE(server_.handleMessage(json::array({n})).is_null());
}

TEST_F(McpServerTest, PingReturnsEmptyObject) {
    json r = server_.handle(request(2, "ping"));
    EXPECT_TRUE(r["result"].is_object());
    EXPECT_TRUE(r["result"].empty());
}

TEST_F(McpServerTest, UnknownMethod) {
    json r = server_.handle(request(3, "does/not/exist"));
    EXPECT_EQ(r["error"]["code"], mcp::rpc_error::METHOD_NOT_FOUND);
}

TEST_F(McpServerTest, InvalidRequests) {
    EXPECT_EQ(server_.handle(json(42))["error"]["code"], mcp::rpc_error::INVALID_REQUEST);

    json noVersion;
    noVersion["id"]     = 1;
    noVersion["method"] = "ping";
    EXPECT_EQ(server_.handle(noVersion)["error"]["code"], mcp::rpc_error::INVALID_REQUEST);

    EXPECT_EQ(server_.handleMessage(json::array())["error"]["code"], mcp::rpc_error::INVALID_REQUEST);
}

TEST_F(McpServerTest, ToolsListKeepsRegistrationOrder) {
    json r = server_.handle(request(4, "tools/list"));
    const json& tools = r["result"]["tools"];
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0]["name"], "echo");
    EXPECT_EQ(tools[1]["name"], "numbers");
    EXPECT_EQ(tools[2]["name"], "explode");
    EXPECT_EQ(tools[0]["inputSchema"]["type"], "object");
}

TEST_F(McpServerTest, ToolCallObjectResult) {
    json r = server_.handle(request(5, "tools/call", json{{"name", "echo"}, {"arguments", json{{"text", "hi"}}}}));
    const json& result = r["result"];
    EXPECT_EQ(result["isError"], false);
    EXPECT_EQ(result["structuredContent"]["text"], "hi");
    EXPECT_EQ(result["content"][0]["type"], "text");
    EXPECT_EQ(json::parse(result["content"][0]["text"].get<std::string>())["text"], "hi");
}

TEST_F(McpServerTest, ToolCallArrayResultIsWrapped) {
    json r = server_.handle(request(6, "tools/call", json{{"name", "numbers"}}));
    EXPECT_EQ(r["result"]["structuredContent"]["result"], json::array({1, 2, 3}));
}

TEST_F(McpServerTest, ToolFailuresAreReportedInBand) {
    json r = server_.handle(request(7, "tools/call", json{{"name", "explode"}}));
    EXPECT_EQ(r["result"]["isError"], true);
    EXPECT_NE(r["result"]["content"][0]["text"].get<std::string>().find("boom"), std::string::npos);

    json missingArg = server_.handle(request(8, "tools/call", json{{"name", "echo"}}));
    EXPECT_EQ(missingArg["result"]["isError"], true);
    EXPECT_NE(missingArg["result"]["content"][0]["text"].get<std::string>().find("'text'"), std::string::npos);
}

TEST_F(McpServerTest, UnknownToolIsInvalidParams) {
    json r = server_.handle(request(9, "tools/call", json{{"name", "nope"}}));
    EXPECT_EQ(r["error"]["code"], mcp::rpc_error::INVALID_PARAMS);

    json noName = server_.handle(request(10, "tools/call"));
    EXPECT_EQ(noName["error"]["code"], mcp::rpc_error::INVALID_PARAMS);
}

TEST_F(McpServerTest, PromptsListAndGet) {
    json list = server_.handle(request(11, "prompts/list"));
    ASSERT_EQ(list["result"]["prompts"].size(), 1u);
    EXPECT_EQ(list["result"]["prompts"][0]["arguments"][0]["required"], true);

    json get = server_.handle(request(12, "prompts/get", json{{"name", "greet"}, {"arguments", json{{"name", "Ada"}}}}));
    const json& msg = get["result"]["messages"][0];
    EXPECT_EQ(msg["role"], "user");
    EXPECT_EQ(msg["content"]["text"], "Hello, Ada");
}

TEST_F(McpServerTest, PromptArgumentErrorsAreInvalidParams) {
    json missing = server_.handle(request(13, "prompts/get", json{{"name", "greet"}}));
    EXPECT_EQ(missing["error"]["code"], mcp::rpc_error::INVALID_PARAMS);

    json rejected = server_.handle(
        request(14, "prompts/get", json{{"name", "greet"}, {"arguments", json{{"name", "nobody"}}}}));
    EXPECT_EQ(rejected["error"]["code"], mcp::rpc_error::INVALID_PARAMS);
}

TEST_F(McpServerTest, ResourcesListAndRead) {
    json list = server_.handle(request(15, "resources/list"));
    ASSERT_EQ(list["result"]["resources"].size(), 1u);
    EXPECT_EQ(list["result"]["resources"][0]["mimeType"], "text/plain");

    json read = server_.handle(request(16, "resources/read", json{{"uri", "test:///static"}}));
    const json& content = read["result"]["contents"][0];
    EXPECT_EQ(content["uri"], "test:///static");
    EXPECT_EQ(content["text"], "fixed");

    json unknown = server_.handle(request(17, "resources/read", json{{"uri", "test:///missing"}}));
    EXPECT_EQ(unknown["error"]["code"], mcp::rpc_error::RESOURCE_NOT_FOUND);
}

TEST_F(McpServerTest, BatchAnswersOnlyRequests) {
    json note;
    note["jsonrpc"] = "2.0";
    note["method"]  = "notifications/initialized";

    json batch = json::array({request(20, "ping"), note, request(21, "tools/list")});
    json r = server_.handleMessage(batch);
    ASSERT_TRUE(r.is_array());
    ASSERT_EQ(r.size(), 2u);
    EXPECT_EQ(r[0]["id"], 20);
    EXPECT_EQ(r[1]["id"], 21);
}

TEST_F(McpServerTest, ReRegisteringReplacesInPlace) {
    json schema;
    schema["type"] = "object";
    server_.addTool(mcp::ToolDefinition{
        "echo", "Replaced", schema, [](const json&) { return json::object(); }});

    auto names = server_.toolNames();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "echo");
    json r = server_.handle(request(22, "tools/list"));
    EXPECT_EQ(r["result"]["tools"][0]["description"], "Replaced");
}
