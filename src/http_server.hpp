#pragma once
#include "tool_registry.hpp"
#include "subagent_manager.hpp"
#include "utils.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <thread>
#include <algorithm>
#include <iostream>

namespace ddcore {

// JSON API over the registry and the subagent manager.
class HttpServer {
public:
    HttpServer(ToolRegistry& registry, SubagentManager& agents, const std::string& host, int port)
        : registry_(registry), agents_(agents), host_(host), port_(port) {}

    ~HttpServer() { stop(); }

    void start() {
        setup_routes();
        thread_ = std::thread([this]() {
            std::cerr << "[http] Listening on " << host_ << ":" << port_ << "\n";
            if (!server_.listen(host_, port_)) {
                std::cerr << "[http] Failed to listen on " << host_ << ":" << port_ << "\n";
            }
        });
    }

    void stop() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

private:
    ToolRegistry& registry_;
    SubagentManager& agents_;
    std::string host_;
    int port_;
    httplib::Server server_;
    std::thread thread_;

    static void send_json(httplib::Response& res, const nlohmann::json& j, int status = 200) {
        res.status = status;
        res.set_content(j.dump(), "application/json");
    }

    static bool parse_body(const httplib::Request& req, httplib::Response& res, nlohmann::json& out) {
        if (req.body.empty()) {
            out = nlohmann::json::object();
            return true;
        }
        out = nlohmann::json::parse(req.body, nullptr, false);
        if (out.is_discarded() || !out.is_object()) {
            send_json(res, {{"error", "invalid JSON in request body"}}, 400);
            return false;
        }
        return true;
    }

    void setup_routes() {
        // Global exception handler for httplib
        server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string msg = "unknown error";
            try { if (ep) std::rethrow_exception(ep); }
            catch (const std::exception& e) { msg = e.what(); }
            catch (...) { msg = "non-std exception"; }
            std::cerr << "[http] " << req.method << " " << req.path << " failed: " << msg << "\n";
            send_json(res, {{"error", msg}}, 500);
        });

        server_.Get("/status", [this](const httplib::Request&, httplib::Response& res) {
            auto& mcp = registry_.mcp();
            send_json(res, {
                {"status", "ok"},
                {"version", DDCORE_VERSION},
                {"timestamp", now_iso8601()},
                {"tools", {
                    {"builtin", registry_.builtin_count()},
                    {"plugin", registry_.plugin_count()},
                    {"instruction", registry_.instruction_count()},
                    {"mcp", mcp.tools().size()}
                }},
                {"mcpServers", {
                    {"configured", mcp.server_count()},
                    {"connected", mcp.connected_count()}
                }},
                {"subagents", {
                    {"running", agents_.running_count()},
                    {"max", agents_.max_concurrent()}
                }}
            });
        });

        server_.Get("/tools", [this](const httplib::Request&, httplib::Response& res) {
            auto tools = registry_.list_all();
            send_json(res, {{"tools", tools}, {"count", tools.size()}});
        });

        server_.Post("/api/tools/execute", [this](const httplib::Request& req, httplib::Response& res) {
            nlohmann::json body;
            if (!parse_body(req, res, body)) return;

            std::string name = body.contains("name") && body["name"].is_string()
                               ? body["name"].get<std::string>() : "";
            if (name.empty()) {
                send_json(res, {{"error", "name is required"}}, 400);
                return;
            }
            nlohmann::json args = body.contains("args") ? body["args"] : nlohmann::json::object();

            auto result = registry_.dispatch(name, args);
            nlohmann::json out = result.to_json();
            out["tool"] = name;
            out["timestamp"] = now_iso8601();
            send_json(res, out);
        });

        server_.Post("/api/tools/reload", [this](const httplib::Request&, httplib::Response& res) {
            auto counts = registry_.reload();
            send_json(res, {{"status", "ok"}, {"counts", counts}});
        });

        server_.Get("/api/mcp/servers", [this](const httplib::Request&, httplib::Response& res) {
            registry_.mcp().refresh();
            send_json(res, {{"servers", registry_.mcp().server_status()}});
        });

        server_.Post(R"(/api/mcp/servers/([^/]+)/reconnect)", [this](const httplib::Request& req, httplib::Response& res) {
            std::string server = req.matches[1];
            auto names = registry_.mcp().server_names();
            if (std::find(names.begin(), names.end(), server) == names.end()) {
                send_json(res, {{"error", "unknown server: " + server}}, 404);
                return;
            }
            bool ok = registry_.mcp().reconnect_server(server);
            send_json(res, {{"server", server}, {"success", ok}}, ok ? 200 : 502);
        });

        server_.Post("/api/subagents/collect", [this](const httplib::Request& req, httplib::Response& res) {
            nlohmann::json body;
            if (!parse_body(req, res, body)) return;

            std::vector<std::string> ids;
            if (body.contains("ids") && body["ids"].is_array()) {
                for (auto& id : body["ids"]) {
                    if (id.is_string()) ids.push_back(id.get<std::string>());
                }
            }
            double timeout_s = body.contains("timeout") && body["timeout"].is_number()
                               ? body["timeout"].get<double>() : 30.0;

            nlohmann::json results = nlohmann::json::array();
            for (auto& rec : agents_.collect_results(ids, seconds_to_ms(timeout_s, 3600.0))) {
                results.push_back(rec.to_json());
            }
            send_json(res, {{"results", results}});
        });

        server_.Post("/api/subagents", [this](const httplib::Request& req, httplib::Response& res) {
            nlohmann::json body;
            if (!parse_body(req, res, body)) return;

            std::string task = body.contains("task") && body["task"].is_string()
                               ? body["task"].get<std::string>() : "";
            if (task.empty()) {
                send_json(res, {{"error", "task is required"}}, 400);
                return;
            }
            std::string type = body.contains("type") && body["type"].is_string()
                               ? body["type"].get<std::string>() : "explore";
            std::string context = body.contains("context") && body["context"].is_string()
                                  ? body["context"].get<std::string>() : "";
            std::vector<std::string> tools;
            if (body.contains("tools") && body["tools"].is_array()) {
                for (auto& t : body["tools"]) {
                    if (t.is_string()) tools.push_back(t.get<std::string>());
                }
            }

            std::string id = agents_.spawn(type, task, tools, context);
            auto rec = agents_.get_status(id);
            send_json(res, {{"id", id}, {"status", rec ? status_name(rec->status) : "unknown"}});
        });

        server_.Get("/api/subagents", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json agents = nlohmann::json::array();
            for (auto& rec : agents_.get_all_status()) agents.push_back(rec.to_json());
            send_json(res, {{"agents", agents}});
        });

        server_.Get(R"(/api/subagents/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
            std::string id = req.matches[1];
            auto rec = agents_.get_status(id);
            if (!rec) {
                send_json(res, {{"error", "unknown agent: " + id}}, 404);
                return;
            }
            send_json(res, rec->to_json());
        });
    }
};

} // namespace ddcore
