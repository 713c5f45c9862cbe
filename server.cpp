// server.cpp
// ExpenseTracker MCP server: HTTP (POST /mcp) or stdio transport.

#include <chrono>
#include <cstdio>
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "backend/ExpenseBackend.hpp"
#include "helpers/Config.hpp"
#include "helpers/Logger.hpp"
#include "mcp/ExpenseTools.hpp"
#include "mcp/McpServer.hpp"
#include "storage/ExpenseStore.hpp"

using json = nlohmann::ordered_json;

namespace {

constexpr const char* kServerName    = "ExpenseTracker";
constexpr const char* kServerVersion = "1.0.0";

void sendJson(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

// newline-delimited JSON-RPC on stdin/stdout
int runStdio(mcp::McpServer& server) {
  util::Logger::info("Serving MCP over stdio");
  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

    json reply;
    try {
      reply = server.handleMessage(json::parse(line));
    } catch (const json::parse_error& e) {
      util::Logger::warn(std::string("stdio: malformed JSON: ") + e.what());
      reply = mcp::McpServer::makeError(nullptr, mcp::rpc_error::PARSE_ERROR,
                                        std::string("Parse error: ") + e.what());
    }
    if (reply.is_null()) continue;

    std::string out;
    try {
      out = reply.dump();
    } catch (const json::exception& e) {
      util::Logger::error(std::string("stdio: cannot serialize reply: ") + e.what());
      out = mcp::McpServer::makeError(reply.is_object() && reply.contains("id") ? reply["id"] : json(nullptr),
                                      mcp::rpc_error::INTERNAL_ERROR, std::string("Internal error: ") + e.what())
                .dump();
    }
    std::cout << out << "\n";
    std::cout.flush();
  }
  util::Logger::info("stdin closed, shutting down");
  return 0;
}

int runHttp(mcp::McpServer& server, const Config& cfg) {
  httplib::Server svr;

  // Log exceptions
  svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    std::string what;
    try {
      if (ep) std::rethrow_exception(ep);
    } catch (const std::exception& e) {
      what = e.what();
      util::Logger::error(std::string("Unhandled exception handling request: ") + req.method + " " + req.path +
                          " error: " + what);
    } catch (...) {
      what = "unknown";
      util::Logger::error(std::string("Unhandled exception handling request: ") + req.method + " " + req.path +
                          " error: unknown");
    }
    sendJson(res, 500, mcp::McpServer::makeError(nullptr, mcp::rpc_error::INTERNAL_ERROR, "Internal error: " + what));
  });

  // We'll track request start times so we can log durations.
  static std::mutex reqMtx;
  static std::unordered_map<const httplib::Request*, std::chrono::steady_clock::time_point> reqStart;

  svr.set_pre_routing_handler(
      [](const httplib::Request& req, httplib::Response& /*res*/) -> httplib::Server::HandlerResponse {
        std::lock_guard<std::mutex> lk(reqMtx);
        reqStart[&req] = std::chrono::steady_clock::now();
        util::Logger::debug(req.method + std::string(" ") + req.path + " from " + req.remote_addr);
        return httplib::Server::HandlerResponse::Unhandled;
      });

  svr.set_post_routing_handler([](const httplib::Request& req, httplib::Response& res) {
    std::chrono::steady_clock::time_point start;
    {
      std::lock_guard<std::mutex> lk(reqMtx);
      auto it = reqStart.find(&req);
      if (it != reqStart.end()) {
        start = it->second;
        reqStart.erase(it);
      }
    }
    if (start.time_since_epoch().count() > 0) {
      auto dur =
          std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
      util::Logger::info(req.method + std::string(" ") + req.path + " -> " + std::to_string(res.status) + " (" +
                         std::to_string(dur) + " ms)");
    }
  });

  svr.set_error_logger([](const httplib::Error& err, const httplib::Request* req) {
    std::string path = req ? req->path : "-";
    util::Logger::warn(std::string("httplib error: ") + httplib::to_string(err) + " path:" + path);
  });

  // =======================
  //      Health Check
  // =======================
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    json j;
    j["status"] = "ok";
    j["message"] = std::string(kServerName) + " server running";
    sendJson(res, 200, j);
  });

  // =======================
  //     MCP (JSON-RPC)
  // =======================

  // POST /mcp
  // Body: one JSON-RPC message or a batch array
  // Reply: 200 with the response(s), 202 when every message was a notification
  svr.Post("/mcp", [&server](const httplib::Request& req, httplib::Response& res) {
    json message;
    try {
      message = json::parse(req.body);
    } catch (const json::parse_error& e) {
      util::Logger::warn(std::string("POST /mcp: malformed JSON: ") + e.what());
      sendJson(res, 400,
               mcp::McpServer::makeError(nullptr, mcp::rpc_error::PARSE_ERROR, std::string("Parse error: ") + e.what()));
      return;
    }

    json reply = server.handleMessage(message);
    if (reply.is_null()) {
      res.status = 202;
      return;
    }
    sendJson(res, 200, reply);
  });

  // No server-initiated stream
  svr.Get("/mcp", [](const httplib::Request&, httplib::Response& res) {
    res.status = 405;
    res.set_header("Allow", "POST");
  });

  util::Logger::info("Server started at http://" + cfg.host + ":" + std::to_string(cfg.port) + "/mcp");
  if (!svr.listen(cfg.host, cfg.port)) {
    util::Logger::error("Failed to listen on " + cfg.host + ":" + std::to_string(cfg.port));
    return 1;
  }
  return 0;
}

}  // namespace

int main() {
  Config cfg = Config::fromEnvironment();

  // stdout carries protocol traffic in stdio mode
  util::Logger::init(cfg.logFile, cfg.logLevel, cfg.transport == Transport::Stdio ? stderr : stdout);

  util::Logger::info(std::string("Database path: ") + cfg.dbPath);
  util::Logger::info(std::string("Categories file: ") + cfg.categoriesPath);
  util::Logger::info(std::string("Transport: ") + transportName(cfg.transport));

  ExpenseStore store(cfg.dbPath);
  try {
    store.initialize();
    util::Logger::info("Database initialized successfully with write access");
  } catch (const StoreError& e) {
    util::Logger::error(std::string("Database initialization error (") + storeErrorKindName(e.kind()) +
                        "): " + e.what());
    util::Logger::shutdown();
    return 1;
  }

  ExpenseBackend backend(store, cfg.categoriesPath);

  mcp::McpServer server(kServerName, kServerVersion);
  mcp::registerExpenseTools(server, backend);
  util::Logger::info("Registered " + std::to_string(server.toolNames().size()) + " tools, " +
                     std::to_string(server.promptNames().size()) + " prompts, " +
                     std::to_string(server.resourceUris().size()) + " resources");

  int rc = cfg.transport == Transport::Stdio ? runStdio(server) : runHttp(server, cfg);

  util::Logger::shutdown();
  return rc;
}
