#include "tool_registry.hpp"
#include "skills_loader.hpp"
#include "process.hpp"
#include <iostream>
#include <set>

namespace ddcore {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string manifest_string(const nlohmann::json& t, const char* key) {
    if (t.contains(key) && t[key].is_string()) return t[key].get<std::string>();
    return "";
}

} // namespace

ToolRegistry::ToolRegistry(const Config& cfg)
    : config_(cfg)
    , mcp_(cfg.mcp_connect_timeout * 1000, cfg.mcp_call_timeout * 1000)
{
    mcp_.set_reserved_filter([this](const std::string& name) { return reserved_name(name); });
}

ToolRegistry::~ToolRegistry() {
    mcp_.shutdown_all();
}

bool ToolRegistry::reserved_name(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return builtins_.count(name) || plugins_.count(name) || instructions_.count(name);
}

// ── Builtins ─────────────────────────────────────────────────────────

void ToolRegistry::register_builtin(const std::string& name, ToolFunction fn) {
    ToolSpec spec;
    spec.name = name;
    register_builtin(std::move(spec), std::move(fn));
}

void ToolRegistry::register_builtin(ToolSpec spec, ToolFunction fn) {
    spec.source = BuiltinSource{};
    std::string name = spec.name;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (builtins_.count(name)) {
            std::cerr << "[registry] Warning: builtin " << name << " already registered, skipping\n";
            return;
        }
        if (plugins_.erase(name) || instructions_.erase(name)) {
            std::cerr << "[registry] Warning: builtin " << name << " replaces a scanned tool\n";
        }
        builtins_[name] = BuiltinEntry{std::move(spec), std::move(fn)};
    }
    // The manager calls back into reserved_name(), so this runs unlocked.
    if (mcp_.has_tool(name)) mcp_.yield_name(name);
}

// ── Scanning ─────────────────────────────────────────────────────────

size_t ToolRegistry::scan_plugins() {
    SkillsLoader loader(config_.skill_paths());
    loader.discover();

    // Names other sources own right now. The MCP snapshot is taken without
    // our lock held: the manager calls back into reserved_name().
    std::set<std::string> builtin_names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [name, _] : builtins_) builtin_names.insert(name);
    }
    std::set<std::string> mcp_names;
    for (auto& t : mcp_.tools()) mcp_names.insert(t.name);

    std::map<std::string, ToolSpec> plugins;
    std::map<std::string, ToolSpec> instructions;
    std::set<std::string> claimed_dirs;

    // Pass 1: manifest plugins
    for (auto& m : loader.manifests()) {
        claimed_dirs.insert(m.dir);
        for (auto& t : m.tools) {
            try {
                if (!t.is_object()) {
                    std::cerr << "[registry] Warning: non-object tool entry in " << m.path << "\n";
                    continue;
                }
                std::string name = manifest_string(t, "toolName");
                std::string exe = manifest_string(t, "executable");
                if (name.empty() || exe.empty()) {
                    std::cerr << "[registry] Warning: tool entry in " << m.path
                              << " lacks toolName or executable, skipping\n";
                    continue;
                }

                fs::path exe_path = fs::path(exe).is_absolute() ? fs::path(exe) : fs::path(m.dir) / exe;
                if (!fs::exists(exe_path)) {
                    std::cerr << "[registry] Warning: executable not found for " << name << ": "
                              << exe_path.string() << ", skipping\n";
                    continue;
                }
                if (builtin_names.count(name)) {
                    std::cerr << "[registry] Warning: plugin " << name << " conflicts with a builtin, skipping\n";
                    continue;
                }
                if (mcp_names.count(name)) {
                    std::cerr << "[registry] Warning: plugin " << name << " conflicts with an MCP tool, skipping\n";
                    continue;
                }
                if (plugins.count(name)) {
                    std::cerr << "[registry] Warning: plugin " << name << " already declared by "
                              << std::get<PluginSource>(plugins[name].source).dir << ", skipping\n";
                    continue;
                }

                PluginSource src;
                src.executable = exe_path.string();
                src.runtime = manifest_string(t, "runtime");
                src.dir = m.dir;
                if (t.contains("keywords") && t["keywords"].is_array()) {
                    for (auto& k : t["keywords"]) {
                        if (k.is_string()) src.keywords.push_back(k.get<std::string>());
                    }
                }

                ToolSpec spec;
                spec.name = name;
                spec.description = manifest_string(t, "description");
                if (t.contains("inputs")) spec.inputs = inputs_from_json(t["inputs"]);
                std::string danger = manifest_string(t, "dangerLevel");
                if (!danger.empty()) spec.danger_level = danger;
                std::string version = manifest_string(t, "version");
                if (!version.empty()) spec.version = version;
                spec.source = std::move(src);
                plugins[name] = std::move(spec);
            } catch (const std::exception& e) {
                std::cerr << "[registry] Warning: bad tool entry in " << m.path << ": " << e.what() << "\n";
            }
        }
    }

    // Pass 2: SKILL.md directories no manifest claimed
    for (auto& s : loader.skills()) {
        if (claimed_dirs.count(s.dir)) continue;

        std::string name = SkillsLoader::normalize_tool_name(s.name);
        if (name.empty()) {
            std::cerr << "[registry] Warning: skill in " << s.dir << " has no usable name, skipping\n";
            continue;
        }
        if (builtin_names.count(name) || mcp_names.count(name) || plugins.count(name) || instructions.count(name)) {
            std::cerr << "[registry] Warning: instruction tool " << name << " conflicts with an existing tool, skipping\n";
            continue;
        }

        ToolSpec spec;
        spec.name = name;
        spec.description = s.description.empty() ? "Instructions for " + s.name : s.description;
        spec.source = InstructionSource{s.path, s.name};
        instructions[name] = std::move(spec);
    }

    size_t total = plugins.size() + instructions.size();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        plugins_.swap(plugins);
        instructions_.swap(instructions);
    }
    std::cerr << "[registry] Scan complete: " << plugin_count() << " plugin(s), "
              << instruction_count() << " instruction tool(s)\n";
    return total;
}

int ToolRegistry::scan_mcp_servers() {
    return mcp_.load_config(config_.mcp_config_path());
}

nlohmann::json ToolRegistry::reload() {
    // Same order as startup: plugins claim names before MCP connects.
    mcp_.shutdown_all();
    scan_plugins();
    int servers = scan_mcp_servers();

    nlohmann::json counts = {
        {"builtins", builtin_count()},
        {"plugins", plugin_count()},
        {"instructions", instruction_count()},
        {"mcpServers", servers},
        {"mcpTools", mcp_.tools().size()}
    };
    std::cerr << "[registry] Reloaded: " << counts.dump() << "\n";
    return counts;
}

// ── Lookup ───────────────────────────────────────────────────────────

bool ToolRegistry::is_registered(const std::string& name) {
    if (reserved_name(name)) return true;
    return mcp_.has_tool(name);
}

std::optional<ToolSpec> ToolRegistry::find(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = instructions_.find(name); it != instructions_.end()) return it->second;
        if (auto it = plugins_.find(name); it != plugins_.end()) return it->second;
        if (auto it = builtins_.find(name); it != builtins_.end()) return it->second.spec;
    }
    for (auto& t : mcp_.tools()) {
        if (t.name != name) continue;
        ToolSpec spec;
        spec.name = t.name;
        spec.description = t.description;
        spec.inputs = inputs_from_json(t.input_schema);
        spec.source = McpSource{t.server, t.remote_name};
        return spec;
    }
    return std::nullopt;
}

std::vector<ToolSpec> ToolRegistry::list_specs() {
    std::vector<ToolSpec> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [_, entry] : builtins_) out.push_back(entry.spec);
        for (auto& [_, spec] : plugins_) out.push_back(spec);
        for (auto& [_, spec] : instructions_) out.push_back(spec);
    }
    for (auto& t : mcp_.tools()) {
        ToolSpec spec;
        spec.name = t.name;
        spec.description = t.description;
        spec.inputs = inputs_from_json(t.input_schema);
        spec.source = McpSource{t.server, t.remote_name};
        out.push_back(std::move(spec));
    }
    return out;
}

nlohmann::json ToolRegistry::list_all() {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& spec : list_specs()) arr.push_back(spec.summary());
    return arr;
}

size_t ToolRegistry::builtin_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return builtins_.size();
}

size_t ToolRegistry::plugin_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return plugins_.size();
}

size_t ToolRegistry::instruction_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instructions_.size();
}

// ── Dispatch ─────────────────────────────────────────────────────────

DispatchResult ToolRegistry::dispatch(const std::string& name, const nlohmann::json& args) {
    std::optional<ToolSpec> instruction;
    std::optional<ToolSpec> plugin;
    ToolFunction builtin;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = instructions_.find(name); it != instructions_.end()) instruction = it->second;
        else if (auto it = plugins_.find(name); it != plugins_.end()) plugin = it->second;
        else if (auto it = builtins_.find(name); it != builtins_.end()) builtin = it->second.func;
    }

    DispatchResult result;
    if (instruction) {
        result = run_instruction(*instruction, args);
    } else if (plugin) {
        result = run_plugin(*plugin, args);
    } else if (mcp_.has_tool(name)) {
        result = run_mcp(name, args);
    } else if (builtin) {
        result = run_builtin(name, builtin, args);
    } else {
        return DispatchResult::error("Unknown tool: " + name);
    }

    result.result = truncate_output(result.result, config_.max_tool_output);
    return result;
}

std::vector<std::string> ToolRegistry::plugin_command(const PluginSource& src) const {
    if (src.runtime.empty() || src.runtime == "binary") return {src.executable};
    auto it = config_.runtimes.find(src.runtime);
    std::string interpreter = it != config_.runtimes.end() ? it->second : src.runtime;
    return {interpreter, src.executable};
}

DispatchResult ToolRegistry::run_plugin(const ToolSpec& spec, const nlohmann::json& args) {
    auto& src = std::get<PluginSource>(spec.source);
    nlohmann::json payload = {
        {"tool", spec.name},
        {"args", args.is_null() ? nlohmann::json::object() : args}
    };

    ProcessResult r;
    try {
        r = run_process(plugin_command(src), payload.dump(), src.dir,
                        config_.tool_timeout * 1000, config_.max_tool_output);
    } catch (const std::exception& e) {
        return DispatchResult::error("Failed to start " + spec.name + ": " + e.what());
    }

    if (r.timed_out) {
        std::cerr << "[registry] Plugin " << spec.name << " timed out after " << config_.tool_timeout << "s\n";
        return DispatchResult::error("Tool " + spec.name + " timed out after "
                                     + std::to_string(config_.tool_timeout) + "s");
    }
    if (r.exit_code != 0) {
        std::string detail = trim(r.err.empty() ? r.out : r.err);
        return DispatchResult::error("Tool " + spec.name + " failed (exit " + std::to_string(r.exit_code) + ")"
                                     + (detail.empty() ? "" : ": " + detail));
    }
    std::string out = r.out;
    if (r.truncated) out += "\n...[truncated]";
    return DispatchResult::success(out);
}

DispatchResult ToolRegistry::run_instruction(const ToolSpec& spec, const nlohmann::json& args) {
    auto& src = std::get<InstructionSource>(spec.source);
    nlohmann::json payload = {
        {"tool", "run_skill"},
        {"args", {
            {"skill_name", src.skill_name},
            {"args", args.is_null() ? nlohmann::json::object() : args},
            {"project_root", config_.data_path()}
        }}
    };

    ProcessResult r;
    try {
        r = run_process(config_.skill_executor_argv(), payload.dump(), "",
                        config_.tool_timeout * 1000, config_.max_tool_output);
    } catch (const std::exception& e) {
        return DispatchResult::error("Failed to start skill executor: " + std::string(e.what()));
    }

    if (r.timed_out) {
        std::cerr << "[registry] Skill " << spec.name << " timed out after " << config_.tool_timeout << "s\n";
        return DispatchResult::error("Skill " + spec.name + " timed out after "
                                     + std::to_string(config_.tool_timeout) + "s");
    }

    nlohmann::json reply = nlohmann::json::parse(r.out, nullptr, false);
    if (reply.is_object() && reply.contains("success") && reply["success"].is_boolean()) {
        if (reply["success"].get<bool>()) {
            nlohmann::json instructions = reply.contains("instructions") ? reply["instructions"] : nlohmann::json("");
            return DispatchResult::success(instructions.is_string() ? instructions.get<std::string>()
                                                                    : instructions.dump());
        }
        nlohmann::json err = reply.contains("error") ? reply["error"] : nlohmann::json("skill failed");
        return DispatchResult::error(err.is_string() ? err.get<std::string>() : err.dump());
    }

    if (r.exit_code == 0) return DispatchResult::success(r.out);
    std::string detail = trim(r.err.empty() ? r.out : r.err);
    return DispatchResult::error("Skill executor failed (exit " + std::to_string(r.exit_code) + ")"
                                 + (detail.empty() ? "" : ": " + detail));
}

DispatchResult ToolRegistry::run_mcp(const std::string& name, const nlohmann::json& args) {
    try {
        return DispatchResult::success(mcp_.call_tool(name, args));
    } catch (const McpTimeoutError& e) {
        std::cerr << "[registry] MCP tool " << name << " timed out\n";
        return DispatchResult::error(std::string("Timeout: ") + e.what());
    } catch (const ToolExecutionError& e) {
        return DispatchResult::error(e.what());
    } catch (const UnknownToolError&) {
        return DispatchResult::error("Unknown tool: " + name);
    } catch (const McpError& e) {
        return DispatchResult::error("MCP error " + std::to_string(e.code()) + ": " + e.what());
    } catch (const std::exception& e) {
        return DispatchResult::error(e.what());
    }
}

DispatchResult ToolRegistry::run_builtin(const std::string& name, const ToolFunction& fn,
                                         const nlohmann::json& args) {
    try {
        return DispatchResult::success(fn(args.is_null() ? nlohmann::json::object() : args));
    } catch (const std::exception& e) {
        std::cerr << "[registry] Builtin " << name << " failed: " << e.what() << "\n";
        return DispatchResult::error(e.what());
    }
}

} // namespace ddcore
